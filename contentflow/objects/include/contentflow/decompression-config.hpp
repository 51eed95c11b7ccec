#pragma once

#include <cstddef>

namespace contentflow {

// Server-wide policy for decoding compressed bodies.
// Per-stream ceilings (maxLength, maxFields, codec buffer size) live in ContentLimitsConfig.
struct DecompressionConfig {
  void validate() const;

  // Master enable flag. When false, no decoding stage is inserted and bodies are delivered verbatim.
  bool enable{true};

  // Maximum compressed size (raw bytes pulled from the connection) we are willing to decode.
  // Protects against large compressed blobs that would only be rejected after wasting CPU.
  // 0 => no compressed size specific cap.
  std::size_t maxCompressedBytes{0};

  // Ratio guard: if decoded_size > compressed_size * maxExpansionRatio the stream is aborted even if
  // maxLength is not reached yet. Quickly rejects "compression bombs" when maxLength is loose.
  // 0.0 => disabled.
  double maxExpansionRatio{0.0};
};

}  // namespace contentflow
