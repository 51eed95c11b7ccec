#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "contentflow/encoding.hpp"
#include "contentflow/vector.hpp"

namespace contentflow::test {

// One-shot compression of 'data' with the given encoding, used to build request bodies in tests.
// Throws exception if the codec is not compiled in or if compression fails.
std::string Compress(Encoding encoding, std::string_view data);

constexpr bool HasZstdMagic(std::string_view body) {
  // zstd frame magic little endian 0x28 B5 2F FD
  return body.size() >= 4 && static_cast<unsigned char>(body[0]) == 0x28 &&
         static_cast<unsigned char>(body[1]) == 0xB5 && static_cast<unsigned char>(body[2]) == 0x2F &&
         static_cast<unsigned char>(body[3]) == 0xFD;
}

constexpr bool HasGzipMagic(std::string_view body) {
  return body.size() >= 2 && static_cast<unsigned char>(body[0]) == 0x1F &&
         static_cast<unsigned char>(body[1]) == 0x8B;
}

// Highly compressible payload (byte values cycling over 0..255).
std::string MakePatternedPayload(std::size_t size);

// Deterministic pseudo random payload, poorly compressible.
std::string MakeRandomPayload(std::size_t size);

// Splits 'data' in consecutive pieces of at most 'chunkSize' bytes (chunkSize 0 means a single piece).
vector<std::string> SplitInChunks(std::string_view data, std::size_t chunkSize);

}  // namespace contentflow::test
