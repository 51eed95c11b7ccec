#include "contentflow/zlib-stream-raii.hpp"

#include <zconf.h>
#include <zlib.h>

#include "contentflow/content-failure.hpp"
#include "contentflow/log.hpp"

namespace contentflow {

namespace {
constexpr int ComputeWindowBits(ZStreamRAII::Variant variant) {
  switch (variant) {
    case ZStreamRAII::Variant::gzip:
      return MAX_WBITS + 16;
    case ZStreamRAII::Variant::deflate:
      return MAX_WBITS;
  }
  return MAX_WBITS;
}
}  // namespace

ZStreamRAII::ZStreamRAII(Variant variant) {
  const auto ret = inflateInit2(&stream, ComputeWindowBits(variant));
  if (ret != Z_OK) {
    log::error("zlib: inflateInit2 failed with error {}", ret);
    throw content_error(ContentFailure{.kind = FailureKind::ResourceInit, .message = "inflateInit2 failed"});
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = inflateEnd(&stream);
  if (ret != Z_OK) {
    log::error("zlib: inflateEnd returned {} (ignored)", ret);
  }
}

}  // namespace contentflow
