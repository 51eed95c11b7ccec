#include "contentflow/zstd-decoder.hpp"

#include <zstd.h>

#include <cstddef>

#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"

namespace contentflow {

ZstdDecoder::ZstdDecoder(std::size_t bufferSize) : CodecAdapter(bufferSize) {
  if (!_stream) {
    throw content_error(ContentFailure{.kind = FailureKind::ResourceInit, .message = "ZSTD_createDStream failed"});
  }
  const std::size_t ret = ZSTD_initDStream(_stream.get());
  if (ZSTD_isError(ret) != 0U) {
    throw content_error(ContentFailure{.kind = FailureKind::ResourceInit, .message = ZSTD_getErrorName(ret)});
  }
}

CodecAdapter::StepResult ZstdDecoder::step(const char* in, std::size_t inSize, char* out,
                                           std::size_t outSize) noexcept {
  ZSTD_inBuffer input{in, inSize, 0};
  ZSTD_outBuffer output{out, outSize, 0};

  const std::size_t ret = ZSTD_decompressStream(_stream.get(), &output, &input);

  StepResult res{.consumed = input.pos, .produced = output.pos};
  if (ZSTD_isError(ret) != 0U) [[unlikely]] {
    res.state = EngineState::Error;
    res.errorMessage = ZSTD_getErrorName(ret);
  } else if (ret == 0) {
    // frame fully decoded and flushed
    res.state = EngineState::StreamEnd;
  }
  return res;
}

}  // namespace contentflow
