#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "contentflow/features.hpp"

namespace contentflow {

enum class Encoding : std::uint8_t {
  zstd,
  br,
  gzip,
  deflate,
  none,  // should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

// Get string representation of encoding as used in Content-Encoding headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {
      "zstd", "br", "gzip", "deflate", "identity",
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Check if encoding is enabled in this build.
constexpr bool IsEncodingEnabled(Encoding enc) {
  constexpr bool kEncodingEnabled[kNbContentEncodings] = {
      zstdEnabled(), brotliEnabled(), zlibEnabled(), zlibEnabled(), true,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return false;
  }
  return kEncodingEnabled[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Case-insensitive mapping of a single Content-Encoding token ("x-gzip" is an alias of "gzip").
// Returns std::nullopt for unknown tokens, regardless of which codecs are compiled in.
std::optional<Encoding> ParseEncoding(std::string_view token) noexcept;

}  // namespace contentflow
