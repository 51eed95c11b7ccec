#include "contentflow/content-limits-config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

#include "contentflow/invalid_argument_exception.hpp"
#include "contentflow/safe-cast.hpp"

namespace contentflow {

namespace {

// Non-positive ceilings mean unbounded, which ContentLimits encodes as 0.
std::size_t ResolveCeiling(const std::optional<std::int64_t>& perCall, const std::optional<std::int64_t>& perContext,
                           const std::optional<std::int64_t>& serverDefault, std::size_t hardcodedDefault) {
  const std::optional<std::int64_t>& chosen = perCall ? perCall : (perContext ? perContext : serverDefault);
  if (!chosen) {
    return hardcodedDefault;
  }
  return *chosen <= 0 ? 0 : SafeCast<std::size_t>(*chosen);
}

}  // namespace

void ContentLimitsConfig::validate() const {
  if (decoderBufferSize && *decoderBufferSize == 0) {
    throw invalid_argument("decoderBufferSize should be > 0 when set");
  }
}

ContentLimits ResolveContentLimits(const ContentLimitsConfig& perCall, const ContentLimitsConfig& perContext,
                                   const ContentLimitsConfig& serverDefault) {
  perCall.validate();
  perContext.validate();
  serverDefault.validate();

  ContentLimits limits;
  limits.maxLength = ResolveCeiling(perCall.maxLength, perContext.maxLength, serverDefault.maxLength,
                                    ContentLimits::kDefaultMaxLength);
  limits.maxFields = ResolveCeiling(perCall.maxFields, perContext.maxFields, serverDefault.maxFields,
                                    ContentLimits::kDefaultMaxFields);
  if (perCall.decoderBufferSize) {
    limits.decoderBufferSize = *perCall.decoderBufferSize;
  } else if (perContext.decoderBufferSize) {
    limits.decoderBufferSize = *perContext.decoderBufferSize;
  } else if (serverDefault.decoderBufferSize) {
    limits.decoderBufferSize = *serverDefault.decoderBufferSize;
  }
  return limits;
}

}  // namespace contentflow
