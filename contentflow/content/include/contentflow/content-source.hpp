#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"

namespace contentflow {

// Pull based producer of chunks.
//
// - read() returns the next chunk and never blocks. It returns Chunk::Empty() when nothing is available yet.
// - demand() registers a one-shot continuation, invoked (possibly synchronously, possibly from another thread)
//   once read() may return something else than Empty.
// - fail() aborts the source: held resources are released and the failure is propagated upstream.
//
// At most one outstanding read() or demand() per instance. Once a last chunk (Eof, last data or Failure)
// has been returned, every further read() returns an equivalent terminal chunk.
class ContentSource {
 public:
  ContentSource() noexcept = default;

  ContentSource(const ContentSource&) = delete;
  ContentSource(ContentSource&&) noexcept = delete;
  ContentSource& operator=(const ContentSource&) = delete;
  ContentSource& operator=(ContentSource&&) noexcept = delete;

  virtual ~ContentSource() = default;

  virtual Chunk read() = 0;

  virtual void demand(std::function<void()> onAvailable) = 0;

  virtual void fail(ContentFailure failure) = 0;
};

using ContentSourcePtr = std::unique_ptr<ContentSource>;

// Remembers how a source ended, to serve the idempotent tail of the stream.
// The first recorded outcome wins.
class TerminalState {
 public:
  [[nodiscard]] bool reached() const noexcept { return _reached; }

  [[nodiscard]] bool isFailure() const noexcept { return _failure.has_value(); }

  void setEof() noexcept { _reached = true; }

  void setFailure(ContentFailure failure) noexcept;

  // Precondition: reached()
  [[nodiscard]] Chunk chunk() const noexcept;

 private:
  std::optional<ContentFailure> _failure;
  bool _reached{false};
};

}  // namespace contentflow
