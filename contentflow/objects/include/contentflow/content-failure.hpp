#pragma once

#include <cstdint>
#include <string_view>

#include "contentflow/exception.hpp"

namespace contentflow {

// Why a stream ended abnormally. The boundary layer maps these to distinct responses.
enum class FailureKind : std::uint8_t {
  Transport,            // upstream I/O broke
  CodecCorruption,      // decoder reported invalid or truncated input
  LimitExceeded,        // a configured ceiling was crossed (see LimitKind)
  ResourceInit,         // codec engine could not be created
  UnsupportedEncoding,  // Content-Encoding token has no compiled-in codec, or header is malformed
  Cancelled,            // consumer gave up on the stream
};

enum class LimitKind : std::uint8_t {
  None,
  Size,            // decoded byte count (maxLength)
  Count,           // number of fields (maxFields)
  CompressedSize,  // raw byte count before decoding (maxCompressedBytes)
  ExpansionRatio,  // decoded bytes / compressed bytes (maxExpansionRatio)
};

struct ContentFailure {
  [[nodiscard]] bool isLimit(LimitKind which) const noexcept {
    return kind == FailureKind::LimitExceeded && limit == which;
  }

  FailureKind kind{FailureKind::Transport};
  LimitKind limit{LimitKind::None};
  // Points to static storage (string literals or codec library error strings).
  const char* message = "";
};

std::string_view FailureKindName(FailureKind kind) noexcept;

std::string_view LimitKindName(LimitKind limit) noexcept;

// Thrown for failures detected before any chunk is pulled (codec allocation, unusable Content-Encoding).
class content_error : public exception {
 public:
  explicit content_error(ContentFailure failure)
      : exception("{}: {}", FailureKindName(failure.kind), failure.message), _failure(failure) {}

  [[nodiscard]] const ContentFailure& failure() const noexcept { return _failure; }

 private:
  ContentFailure _failure;
};

}  // namespace contentflow
