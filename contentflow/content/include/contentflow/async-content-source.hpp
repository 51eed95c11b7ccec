#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <string_view>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

// Source fed by a producer (typically the connection layer), possibly from another thread.
// The producer calls write() for each received piece of body, then close() or fail().
// Demand continuations are invoked outside of the internal lock, from the thread calling write(), close() or fail()
// (or synchronously from demand() if data is already there).
class AsyncContentSource final : public ContentSource {
 public:
  // Producer side. Returns false if the source is already closed or failed (the bytes are dropped).
  bool write(std::string_view bytes, bool last = false);

  bool write(RawChars bytes, bool last = false);

  // Signals the end of the body.
  void close();

  // Consumer side.
  Chunk read() override;

  void demand(std::function<void()> onAvailable) override;

  // Also callable by the producer, to report a transport failure.
  void fail(ContentFailure failure) override;

  // Tells whether the consumer side aborted the stream (or the producer reported a failure).
  [[nodiscard]] bool failed() const;

 private:
  std::function<void()> takeDemand();

  mutable std::mutex _mutex;
  std::deque<RawChars> _pending;
  std::function<void()> _onAvailable;
  TerminalState _terminal;
  bool _closed{false};
};

}  // namespace contentflow
