#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <utility>

#include "contentflow/content-failure.hpp"
#include "contentflow/form-fields.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

// Incremental parser of application/x-www-form-urlencoded content.
// Pairs are separated by '&', names from values by the first '='. '+' decodes to a space and percent escapes are
// decoded when valid (invalid or truncated escapes are kept verbatim). Pairs with an empty name are ignored.
class FormParser {
 public:
  // Invoked once per parsed name (duplicates included) before it is stored. A returned failure stops the parsing.
  using FieldObserver = std::function<std::optional<ContentFailure>()>;

  explicit FormParser(FieldObserver onField = {}) : _onField(std::move(onField)) {}

  // Parses the next bytes of the content. A pair may span several calls.
  std::optional<ContentFailure> feed(std::string_view bytes);

  // Flushes the last pair, to be called at end of content.
  std::optional<ContentFailure> finish();

  [[nodiscard]] const FormFields& fields() const noexcept { return _fields; }

  [[nodiscard]] FormFields takeFields() noexcept { return std::move(_fields); }

 private:
  std::optional<ContentFailure> flushPair();

  FieldObserver _onField;
  RawChars _pair;
  FormFields _fields;
};

}  // namespace contentflow
