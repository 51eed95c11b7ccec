#include "contentflow/form-parser.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "contentflow/content-failure.hpp"
#include "contentflow/log.hpp"
#include "contentflow/url-decode.hpp"

namespace contentflow {

namespace {

std::string DecodeComponent(char* first, char* last) {
  const char* end = url::DecodeInPlace(first, last, ' ', /*strictInvalid=*/false);
  return std::string(first, static_cast<std::size_t>(end - first));
}

}  // namespace

std::optional<ContentFailure> FormParser::feed(std::string_view bytes) {
  while (!bytes.empty()) {
    const std::size_t ampPos = bytes.find('&');
    if (ampPos == std::string_view::npos) {
      _pair.append(bytes);
      break;
    }
    _pair.append(bytes.substr(0, ampPos));
    bytes.remove_prefix(ampPos + 1);
    auto failure = flushPair();
    if (failure) {
      return failure;
    }
  }
  return std::nullopt;
}

std::optional<ContentFailure> FormParser::finish() { return flushPair(); }

std::optional<ContentFailure> FormParser::flushPair() {
  if (_pair.empty()) {
    return std::nullopt;
  }
  char* first = _pair.data();
  char* last = _pair.data() + _pair.size();
  char* eq = first;
  while (eq != last && *eq != '=') {
    ++eq;
  }

  std::string name = DecodeComponent(first, eq);
  std::string value = eq == last ? std::string() : DecodeComponent(eq + 1, last);
  _pair.clear();

  if (name.empty()) {
    log::debug("FormParser - ignoring pair with empty name");
    return std::nullopt;
  }
  if (_onField) {
    auto failure = _onField();
    if (failure) {
      return failure;
    }
  }
  _fields.add(std::move(name), std::move(value));
  return std::nullopt;
}

}  // namespace contentflow
