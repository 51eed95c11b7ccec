#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace contentflow {

// One precedence layer of per-stream ceilings. Unset fields defer to the next layer.
// Ceilings are signed on purpose: zero or negative values are an explicit opt-out meaning "unbounded".
struct ContentLimitsConfig {
  void validate() const;

  // Maximum number of decoded bytes (maxFormContentSize).
  std::optional<std::int64_t> maxLength;

  // Maximum number of fields / keys reported by the parsing layer (maxFormKeys).
  std::optional<std::int64_t> maxFields;

  // Size of the codec input and output buffers, which is also the largest decoded chunk produced.
  std::optional<std::size_t> decoderBufferSize;
};

// Ceilings resolved once at stream construction. 0 means unbounded.
struct ContentLimits {
  static constexpr std::size_t kDefaultMaxLength = 200000;
  static constexpr std::size_t kDefaultMaxFields = 1000;
  static constexpr std::size_t kDefaultDecoderBufferSize = 16UL * 1024UL;

  [[nodiscard]] bool lengthBounded() const noexcept { return maxLength != 0; }
  [[nodiscard]] bool fieldsBounded() const noexcept { return maxFields != 0; }

  std::size_t maxLength{kDefaultMaxLength};
  std::size_t maxFields{kDefaultMaxFields};
  std::size_t decoderBufferSize{kDefaultDecoderBufferSize};
};

// Resolves each ceiling by precedence: per-call > per-context > server-wide > hardcoded default.
ContentLimits ResolveContentLimits(const ContentLimitsConfig& perCall, const ContentLimitsConfig& perContext = {},
                                   const ContentLimitsConfig& serverDefault = {});

}  // namespace contentflow
