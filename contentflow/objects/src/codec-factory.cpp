#include <cstddef>
#include <memory>

#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/encoding.hpp"
#include "contentflow/log.hpp"

#ifdef CONTENTFLOW_ENABLE_ZLIB
#include "contentflow/zlib-decoder.hpp"
#endif

#ifdef CONTENTFLOW_ENABLE_BROTLI
#include "contentflow/brotli-decoder.hpp"
#endif

#ifdef CONTENTFLOW_ENABLE_ZSTD
#include "contentflow/zstd-decoder.hpp"
#endif

namespace contentflow {

std::unique_ptr<CodecAdapter> MakeCodecAdapter(Encoding encoding, [[maybe_unused]] std::size_t bufferSize) {
  switch (encoding) {
#ifdef CONTENTFLOW_ENABLE_ZSTD
    case Encoding::zstd:
      return std::make_unique<ZstdDecoder>(bufferSize);
#endif
#ifdef CONTENTFLOW_ENABLE_BROTLI
    case Encoding::br:
      return std::make_unique<BrotliDecoder>(bufferSize);
#endif
#ifdef CONTENTFLOW_ENABLE_ZLIB
    case Encoding::gzip:
      return std::make_unique<ZlibDecoder>(/*isGzip=*/true, bufferSize);
    case Encoding::deflate:
      return std::make_unique<ZlibDecoder>(/*isGzip=*/false, bufferSize);
#endif
    default:
      break;
  }
  log::warn("No decoder compiled in for encoding '{}'", GetEncodingStr(encoding));
  throw content_error(ContentFailure{.kind = FailureKind::UnsupportedEncoding, .message = "unsupported encoding"});
}

}  // namespace contentflow
