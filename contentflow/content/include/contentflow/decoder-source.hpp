#pragma once

#include <cstddef>
#include <functional>
#include <memory>

#include "contentflow/chunk.hpp"
#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-source.hpp"

namespace contentflow {

// Source decoding the chunks of an upstream source with a CodecAdapter.
//
// Each read() pulls at most one upstream chunk and returns at most one decoded chunk, no larger than the adapter
// buffer size, so the whole payload is never materialized. Empty chunks from upstream are propagated without
// touching the codec. Bytes following the end of the compressed stream are read from upstream and discarded.
//
// The codec engine is released exactly once, as soon as the stream reaches a terminal state
// (end of stream, corruption, upstream failure or fail()), or by the destructor otherwise.
class DecoderSource final : public ContentSource {
 public:
  DecoderSource(ContentSourcePtr upstream, std::unique_ptr<CodecAdapter> adapter);

  Chunk read() override;

  void demand(std::function<void()> onAvailable) override;

  void fail(ContentFailure failure) override;

  // Tells whether the codec engine is still held.
  [[nodiscard]] bool holdsCodec() const noexcept { return _adapter != nullptr; }

 private:
  [[nodiscard]] bool pendingConsumed() const noexcept { return _pendingPos == _pending.size(); }

  [[nodiscard]] bool needsUpstream() const noexcept;

  Chunk terminate(Chunk terminal);

  ContentSourcePtr _upstream;
  std::unique_ptr<CodecAdapter> _adapter;
  Chunk _pending;  // upstream chunk partially pushed to the codec
  std::size_t _pendingPos{0};
  TerminalState _terminal;
  bool _upstreamLast{false};
};

}  // namespace contentflow
