#include "contentflow/brotli-decoder.hpp"

#include <brotli/decode.h>

#include <cstddef>
#include <cstdint>

#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"

namespace contentflow {

BrotliDecoder::BrotliDecoder(std::size_t bufferSize) : CodecAdapter(bufferSize) {
  if (_state == nullptr) {
    throw content_error(
        ContentFailure{.kind = FailureKind::ResourceInit, .message = "BrotliDecoderCreateInstance failed"});
  }
}

CodecAdapter::StepResult BrotliDecoder::step(const char* in, std::size_t inSize, char* out,
                                             std::size_t outSize) noexcept {
  const auto* nextIn = reinterpret_cast<const uint8_t*>(in);
  std::size_t availIn = inSize;
  auto* nextOut = reinterpret_cast<uint8_t*>(out);
  std::size_t availOut = outSize;

  const auto ret = BrotliDecoderDecompressStream(_state.get(), &availIn, &nextIn, &availOut, &nextOut, nullptr);

  StepResult res{.consumed = inSize - availIn, .produced = outSize - availOut};
  switch (ret) {
    case BROTLI_DECODER_RESULT_SUCCESS:
      res.state = EngineState::StreamEnd;
      break;
    case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
      [[fallthrough]];
    case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
      break;
    case BROTLI_DECODER_RESULT_ERROR:
      [[fallthrough]];
    default:
      res.state = EngineState::Error;
      res.errorMessage = BrotliDecoderErrorString(BrotliDecoderGetErrorCode(_state.get()));
      break;
  }
  return res;
}

}  // namespace contentflow
