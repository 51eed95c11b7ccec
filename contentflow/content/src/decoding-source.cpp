#include "contentflow/decoding-source.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-limits-config.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/decoder-source.hpp"
#include "contentflow/decompression-config.hpp"
#include "contentflow/encoding.hpp"
#include "contentflow/limited-source.hpp"
#include "contentflow/log.hpp"
#include "contentflow/vector.hpp"

namespace contentflow {

namespace {

constexpr bool IsOws(char ch) { return ch == ' ' || ch == '\t'; }

constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && IsOws(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsOws(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Helper to iterate Content-Encoding header values in reverse order.
class CSVReverseTokensIterator {
 public:
  explicit CSVReverseTokensIterator(std::string_view headerValue)
      : _first(headerValue.data()), _last(_first + headerValue.size()) {}

  // Returns true if there is another value to read.
  [[nodiscard]] bool hasNext() const noexcept { return _first < _last; }

  // Returns the next value token, or empty string_view if malformed.
  std::string_view next() {
    const char* nextSep = _last - 1;
    while (nextSep >= _first && *nextSep != ',' && !IsOws(*nextSep)) {
      --nextSep;
    }

    std::string_view value(nextSep + 1, _last);
    if (value.empty()) {
      // empty token forbidden
      return value;
    }

    // go to next non-OWS/comma char to the left and reject multiple commas in a row
    bool seenComma = false;
    while (nextSep >= _first && (IsOws(*nextSep) || *nextSep == ',')) {
      if (*nextSep == ',') {
        if (seenComma) {
          return {};
        }
        seenComma = true;
      }
      --nextSep;
    }
    if (nextSep < _first && seenComma) {
      // leading comma
      return {};
    }
    _last = nextSep + 1;

    return value;
  }

 private:
  const char* _first;
  const char* _last;
};

[[noreturn]] void ThrowUnsupported(const char* message) {
  throw content_error(ContentFailure{.kind = FailureKind::UnsupportedEncoding, .message = message});
}

// Returns the codings to undo, in decoding order.
vector<Encoding> ParseContentEncoding(std::string_view contentEncoding) {
  vector<Encoding> codings;
  contentEncoding = TrimOws(contentEncoding);
  if (!contentEncoding.empty() && contentEncoding.back() == ',') {
    ThrowUnsupported("malformed Content-Encoding");
  }
  for (CSVReverseTokensIterator it(contentEncoding); it.hasNext();) {
    const std::string_view token = it.next();
    if (token.empty()) {
      ThrowUnsupported("malformed Content-Encoding");
    }
    const std::optional<Encoding> encoding = ParseEncoding(token);
    if (!encoding) {
      log::warn("Unsupported Content-Encoding token '{}'", token);
      ThrowUnsupported("unknown Content-Encoding");
    }
    if (*encoding == Encoding::none) {
      continue;
    }
    if (!IsEncodingEnabled(*encoding)) {
      log::warn("Content-Encoding '{}' is not compiled in", token);
      ThrowUnsupported("Content-Encoding not compiled in");
    }
    codings.push_back(*encoding);
  }
  return codings;
}

}  // namespace

std::unique_ptr<LimitedSource> MakeDecodingSource(ContentSourcePtr raw, std::string_view contentEncoding,
                                                  const DecompressionConfig& config, const ContentLimits& limits) {
  config.validate();

  vector<Encoding> codings;
  if (config.enable) {
    codings = ParseContentEncoding(contentEncoding);
  }

  const LimitedSource* compressedSide = nullptr;
  if (!codings.empty() && (config.maxCompressedBytes != 0 || config.maxExpansionRatio > 0.0)) {
    auto rawGuard = std::make_unique<LimitedSource>(std::move(raw), config.maxCompressedBytes, 0,
                                                    LimitKind::CompressedSize);
    compressedSide = rawGuard.get();
    raw = std::move(rawGuard);
  }

  for (Encoding encoding : codings) {
    raw = std::make_unique<DecoderSource>(std::move(raw), MakeCodecAdapter(encoding, limits.decoderBufferSize));
  }

  auto top = std::make_unique<LimitedSource>(std::move(raw), limits.maxLength, limits.maxFields);
  if (compressedSide != nullptr && config.maxExpansionRatio > 0.0) {
    top->setExpansionRatioGuard(compressedSide, config.maxExpansionRatio);
  }

  log::debug("Decoding pipeline built with {} coding(s), maxLength={}, maxFields={}", codings.size(),
             limits.maxLength, limits.maxFields);
  return top;
}

}  // namespace contentflow
