#pragma once

#include <memory>
#include <string_view>

#include "contentflow/content-limits-config.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/decompression-config.hpp"
#include "contentflow/limited-source.hpp"

namespace contentflow {

// Builds the pipeline delivering the decoded body of a message received with the given Content-Encoding value:
//
//   raw -> [LimitedSource(maxCompressedBytes)] -> DecoderSource(last coding) -> ... -> DecoderSource(first coding)
//       -> LimitedSource(maxLength, maxFields, maxExpansionRatio)
//
// Codings are applied right to left, 'identity' tokens are skipped. When decompression is disabled, or when there is
// no coding to undo, the body is only guarded by the top LimitedSource.
// Throws content_error(UnsupportedEncoding) for unknown or not compiled in codings and malformed values,
// content_error(ResourceInit) if a codec engine cannot be created and invalid_argument for inconsistent
// configuration. Nothing is pulled from 'raw' before the first read().
std::unique_ptr<LimitedSource> MakeDecodingSource(ContentSourcePtr raw, std::string_view contentEncoding,
                                                  const DecompressionConfig& config, const ContentLimits& limits);

}  // namespace contentflow
