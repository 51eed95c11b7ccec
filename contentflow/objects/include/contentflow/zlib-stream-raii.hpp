#pragma once

#include <zlib.h>

#include <cstdint>

namespace contentflow {

// Owns an inflate z_stream. inflateEnd is called exactly once, by the destructor.
struct ZStreamRAII {
  enum class Variant : int8_t { gzip, deflate };

  // Initialize a z_stream for decompression.
  // Throws content_error(ResourceInit) on failure.
  explicit ZStreamRAII(Variant variant);

  // z_stream is not moveable or copyable - delete these operations
  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};
};

}  // namespace contentflow
