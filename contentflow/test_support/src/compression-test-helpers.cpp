#include "contentflow/compression-test-helpers.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <string>
#include <string_view>

#include "contentflow/encoding.hpp"
#include "contentflow/exception.hpp"
#include "contentflow/vector.hpp"

#ifdef CONTENTFLOW_ENABLE_ZLIB
#include <zconf.h>
#include <zlib.h>
#endif

#ifdef CONTENTFLOW_ENABLE_BROTLI
#include <brotli/encode.h>
#endif

#ifdef CONTENTFLOW_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace contentflow::test {

namespace {

#ifdef CONTENTFLOW_ENABLE_ZLIB
std::string ZlibCompress(std::string_view data, bool isGzip) {
  z_stream stream{};
  const int windowBits = isGzip ? MAX_WBITS + 16 : MAX_WBITS;
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw exception("deflateInit2 failed");
  }
  std::string out;
  out.resize(deflateBound(&stream, static_cast<uLong>(data.size())) + 32U);
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());
  const int ret = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);
  if (ret != Z_STREAM_END) {
    throw exception("deflate failed with error {}", ret);
  }
  out.resize(stream.total_out);
  return out;
}
#endif

#ifdef CONTENTFLOW_ENABLE_BROTLI
std::string BrotliCompress(std::string_view data) {
  std::string out;
  std::size_t encodedSize = BrotliEncoderMaxCompressedSize(data.size());
  if (encodedSize == 0) {
    encodedSize = data.size() + 1024U;
  }
  out.resize(encodedSize);
  if (BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_GENERIC, data.size(),
                            reinterpret_cast<const uint8_t*>(data.data()), &encodedSize,
                            reinterpret_cast<uint8_t*>(out.data())) == BROTLI_FALSE) {
    throw exception("BrotliEncoderCompress failed");
  }
  out.resize(encodedSize);
  return out;
}
#endif

#ifdef CONTENTFLOW_ENABLE_ZSTD
std::string ZstdCompress(std::string_view data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const std::size_t ret = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(ret) != 0U) {
    throw exception("ZSTD_compress failed: {}", ZSTD_getErrorName(ret));
  }
  out.resize(ret);
  return out;
}
#endif

}  // namespace

std::string Compress(Encoding encoding, [[maybe_unused]] std::string_view data) {
  switch (encoding) {
#ifdef CONTENTFLOW_ENABLE_ZLIB
    case Encoding::gzip:
      return ZlibCompress(data, true);
    case Encoding::deflate:
      return ZlibCompress(data, false);
#endif
#ifdef CONTENTFLOW_ENABLE_BROTLI
    case Encoding::br:
      return BrotliCompress(data);
#endif
#ifdef CONTENTFLOW_ENABLE_ZSTD
    case Encoding::zstd:
      return ZstdCompress(data);
#endif
    case Encoding::none:
      return std::string(data);
    default:
      break;
  }
  throw exception("Encoding {} not compiled in", GetEncodingStr(encoding));
}

std::string MakePatternedPayload(std::size_t size) {
  std::string payload;
  payload.resize_and_overwrite(size, [](char* data, std::size_t size) {
    std::iota(data, data + size, static_cast<unsigned char>(0));
    return size;
  });
  return payload;
}

std::string MakeRandomPayload(std::size_t size) {
  std::string payload(size, '\0');
  std::mt19937_64 rng{123456789ULL};
  std::uniform_int_distribution<int> dist(0, 255);
  for (char& ch : payload) {
    ch = static_cast<char>(dist(rng));
  }
  return payload;
}

vector<std::string> SplitInChunks(std::string_view data, std::size_t chunkSize) {
  vector<std::string> chunks;
  if (chunkSize == 0) {
    chunkSize = std::max<std::size_t>(data.size(), 1);
  }
  while (!data.empty()) {
    const std::size_t len = std::min(chunkSize, data.size());
    chunks.emplace_back(data.substr(0, len));
    data.remove_prefix(len);
  }
  return chunks;
}

}  // namespace contentflow::test
