#include "contentflow/encoding.hpp"

#include <optional>
#include <string_view>
#include <type_traits>

#include "contentflow/string-equal-ignore-case.hpp"

namespace contentflow {

std::optional<Encoding> ParseEncoding(std::string_view token) noexcept {
  for (std::underlying_type_t<Encoding> pos = 0; pos < kNbContentEncodings; ++pos) {
    const auto enc = static_cast<Encoding>(pos);
    if (CaseInsensitiveEqual(token, GetEncodingStr(enc))) {
      return enc;
    }
  }
  if (CaseInsensitiveEqual(token, "x-gzip")) {
    return Encoding::gzip;
  }
  return std::nullopt;
}

}  // namespace contentflow
