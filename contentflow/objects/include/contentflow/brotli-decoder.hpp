#pragma once

#include <brotli/decode.h>

#include <cstddef>
#include <memory>
#include <string_view>

#include "contentflow/codec-adapter.hpp"

namespace contentflow {

// Streaming decoder for the 'br' content coding.
class BrotliDecoder final : public CodecAdapter {
 public:
  explicit BrotliDecoder(std::size_t bufferSize);

 private:
  using BrotliStateUniquePtr = std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>;

  StepResult step(const char* in, std::size_t inSize, char* out, std::size_t outSize) noexcept override;

  [[nodiscard]] std::string_view name() const noexcept override { return "br"; }

  BrotliStateUniquePtr _state{BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance};
};

}  // namespace contentflow
