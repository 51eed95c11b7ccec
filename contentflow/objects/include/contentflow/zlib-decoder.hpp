#pragma once

#include <cstddef>
#include <string_view>

#include "contentflow/codec-adapter.hpp"
#include "contentflow/zlib-stream-raii.hpp"

namespace contentflow {

// Streaming inflate for the 'gzip' (RFC 1952) and 'deflate' (zlib wrapped, RFC 1950) content codings.
// Only the first gzip member is decoded, bytes following it are discarded.
class ZlibDecoder final : public CodecAdapter {
 public:
  ZlibDecoder(bool isGzip, std::size_t bufferSize);

 private:
  StepResult step(const char* in, std::size_t inSize, char* out, std::size_t outSize) noexcept override;

  [[nodiscard]] std::string_view name() const noexcept override { return _isGzip ? "gzip" : "deflate"; }

  ZStreamRAII _context;
  bool _isGzip;
};

}  // namespace contentflow
