#pragma once

#include <zstd.h>

#include <cstddef>
#include <memory>
#include <string_view>

#include "contentflow/codec-adapter.hpp"

namespace contentflow {

// Streaming decoder for the 'zstd' content coding. Decodes a single frame.
class ZstdDecoder final : public CodecAdapter {
 public:
  explicit ZstdDecoder(std::size_t bufferSize);

 private:
  StepResult step(const char* in, std::size_t inSize, char* out, std::size_t outSize) noexcept override;

  [[nodiscard]] std::string_view name() const noexcept override { return "zstd"; }

  std::unique_ptr<ZSTD_DStream, decltype(&ZSTD_freeDStream)> _stream{ZSTD_createDStream(), &ZSTD_freeDStream};
};

}  // namespace contentflow
