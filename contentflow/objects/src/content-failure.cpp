#include "contentflow/content-failure.hpp"

#include <string_view>

namespace contentflow {

std::string_view FailureKindName(FailureKind kind) noexcept {
  switch (kind) {
    case FailureKind::Transport:
      return "transport";
    case FailureKind::CodecCorruption:
      return "codec corruption";
    case FailureKind::LimitExceeded:
      return "limit exceeded";
    case FailureKind::ResourceInit:
      return "resource init";
    case FailureKind::UnsupportedEncoding:
      return "unsupported encoding";
    case FailureKind::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string_view LimitKindName(LimitKind limit) noexcept {
  switch (limit) {
    case LimitKind::None:
      return "none";
    case LimitKind::Size:
      return "size";
    case LimitKind::Count:
      return "count";
    case LimitKind::CompressedSize:
      return "compressed size";
    case LimitKind::ExpansionRatio:
      return "expansion ratio";
  }
  return "unknown";
}

}  // namespace contentflow
