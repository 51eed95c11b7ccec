#include "contentflow/decompression-config.hpp"

#include <cmath>

#include "contentflow/invalid_argument_exception.hpp"

namespace contentflow {

void DecompressionConfig::validate() const {
  if (std::isnan(maxExpansionRatio) || maxExpansionRatio < 0.0) {
    throw invalid_argument("maxExpansionRatio must be >= 0, got {}", maxExpansionRatio);
  }
  if (maxExpansionRatio != 0.0 && maxExpansionRatio < 1.0) {
    throw invalid_argument("maxExpansionRatio should be 0 (disabled) or >= 1, got {}", maxExpansionRatio);
  }
}

}  // namespace contentflow
