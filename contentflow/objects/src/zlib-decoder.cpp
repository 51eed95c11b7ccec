#include "contentflow/zlib-decoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <algorithm>
#include <cstddef>
#include <limits>

#include "contentflow/codec-adapter.hpp"
#include "contentflow/zlib-stream-raii.hpp"

namespace contentflow {

ZlibDecoder::ZlibDecoder(bool isGzip, std::size_t bufferSize)
    : CodecAdapter(bufferSize),
      _context(isGzip ? ZStreamRAII::Variant::gzip : ZStreamRAII::Variant::deflate),
      _isGzip(isGzip) {}

CodecAdapter::StepResult ZlibDecoder::step(const char* in, std::size_t inSize, char* out,
                                           std::size_t outSize) noexcept {
  auto& stream = _context.stream;

  static constexpr std::size_t kMaxAvail = std::numeric_limits<uInt>::max();
  inSize = std::min(inSize, kMaxAvail);
  outSize = std::min(outSize, kMaxAvail);

  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in));
  stream.avail_in = static_cast<uInt>(inSize);
  stream.next_out = reinterpret_cast<Bytef*>(out);
  stream.avail_out = static_cast<uInt>(outSize);

  const auto ret = inflate(&stream, Z_NO_FLUSH);

  StepResult res{.consumed = inSize - stream.avail_in, .produced = outSize - stream.avail_out};
  switch (ret) {
    case Z_OK:
      [[fallthrough]];
    case Z_BUF_ERROR:
      // Z_BUF_ERROR only means that no progress was possible with the given buffers.
      break;
    case Z_STREAM_END:
      res.state = EngineState::StreamEnd;
      break;
    default:
      res.state = EngineState::Error;
      res.errorMessage = stream.msg != nullptr ? stream.msg : zError(ret);
      break;
  }
  return res;
}

}  // namespace contentflow
