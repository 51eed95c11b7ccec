#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/exception.hpp"

namespace contentflow {

// Consumes the chunks of a stream, in order, and builds a Result out of them.
// accept() returns the final Result once it is known, std::nullopt to receive the next chunk.
// It must return a Result when given a last chunk (Eof, last data or Failure). Empty chunks are never given.
template <class Result>
class ChunkConsumer {
 public:
  virtual ~ChunkConsumer() = default;

  virtual std::optional<Result> accept(Chunk chunk) = 0;
};

namespace internal {

// One-shot rendez-vous between a demand continuation and a blocked thread.
class DemandWaiter {
 public:
  void notify() {
    std::scoped_lock lock(_mutex);
    _ready = true;
    _cv.notify_all();
  }

  void wait() {
    std::unique_lock lock(_mutex);
    _cv.wait(lock, [this] { return _ready; });
  }

 private:
  std::mutex _mutex;
  std::condition_variable _cv;
  bool _ready{false};
};

// Blocks the calling thread until 'source' may have new data.
void AwaitDemand(ContentSource& source);

class AsyncDrainBase {
 public:
  AsyncDrainBase() noexcept = default;

  AsyncDrainBase(const AsyncDrainBase&) = delete;
  AsyncDrainBase(AsyncDrainBase&&) noexcept = delete;
  AsyncDrainBase& operator=(const AsyncDrainBase&) = delete;
  AsyncDrainBase& operator=(AsyncDrainBase&&) noexcept = delete;

  virtual ~AsyncDrainBase() = default;

  // Returns false if the drain already completed or was cancelled.
  virtual bool cancel() = 0;

  [[nodiscard]] virtual bool done() const = 0;
};

}  // namespace internal

// Handle on a non-blocking drain started by DrainAsync.
class DrainHandle {
 public:
  DrainHandle() noexcept = default;

  explicit DrainHandle(std::shared_ptr<internal::AsyncDrainBase> drain) noexcept : _drain(std::move(drain)) {}

  // Aborts the stream with a Cancelled failure, propagated upstream so that all held resources are released.
  // The completion callback will not be invoked, and continuations still registered on the source become no-ops.
  // Returns false if the drain already completed (or was already cancelled).
  bool cancel() { return _drain && _drain->cancel(); }

  // Tells whether the drain completed or was cancelled.
  [[nodiscard]] bool done() const { return !_drain || _drain->done(); }

 private:
  std::shared_ptr<internal::AsyncDrainBase> _drain;
};

// Blocking driver: reads 'source' until 'consumer' produces its result, blocking the calling thread on demand()
// whenever the source has nothing available.
template <class Result>
Result DrainBlocking(ContentSource& source, ChunkConsumer<Result>& consumer) {
  while (true) {
    Chunk chunk = source.read();
    if (chunk.isEmpty()) {
      internal::AwaitDemand(source);
      continue;
    }
    const bool last = chunk.isLast();
    std::optional<Result> result = consumer.accept(std::move(chunk));
    if (result) {
      return std::move(*result);
    }
    if (last) {
      throw exception("ChunkConsumer did not produce a result on the last chunk");
    }
  }
}

namespace internal {

template <class Result>
class AsyncDrain final : public AsyncDrainBase, public std::enable_shared_from_this<AsyncDrain<Result>> {
 public:
  AsyncDrain(ContentSourcePtr source, std::unique_ptr<ChunkConsumer<Result>> consumer,
             std::function<void(Result)> onComplete)
      : _source(std::move(source)), _consumer(std::move(consumer)), _onComplete(std::move(onComplete)) {}

  // Reads as long as chunks are available, then registers a continuation on the source.
  // A consumer breaking its contract ends the drain without completion, and the error is thrown to the caller
  // of run(), which may be the producer thread feeding the source.
  // The lock is recursive because sources may invoke the continuation synchronously from demand() or fail().
  void run() {
    std::unique_lock lock(_mutex);
    if (_running) {
      // synchronous continuation, picked up by the loop below
      _rerun = true;
      return;
    }
    _running = true;
    std::optional<Result> result;
    try {
      do {
        _rerun = false;
        if (!pump(result)) {
          break;
        }
        _source->demand([self = this->shared_from_this()] { self->run(); });
      } while (_rerun && !_done);
    } catch (...) {
      // the drain is done, later continuations must still find it idle
      _running = false;
      throw;
    }
    _running = false;
    lock.unlock();
    if (result) {
      _onComplete(std::move(*result));
    }
  }

  bool cancel() override {
    std::scoped_lock lock(_mutex);
    if (_done) {
      return false;
    }
    _done = true;
    _source->fail(ContentFailure{.kind = FailureKind::Cancelled, .message = "drain cancelled"});
    return true;
  }

  [[nodiscard]] bool done() const override {
    std::scoped_lock lock(_mutex);
    return _done;
  }

 private:
  // Returns true if the source has nothing available and a continuation should be registered.
  bool pump(std::optional<Result>& result) {
    while (!_done) {
      Chunk chunk = _source->read();
      if (chunk.isEmpty()) {
        return true;
      }
      const bool last = chunk.isLast();
      result = _consumer->accept(std::move(chunk));
      if (result) {
        _done = true;
        return false;
      }
      if (last) {
        _done = true;
        throw exception("ChunkConsumer did not produce a result on the last chunk");
      }
    }
    return false;
  }

  mutable std::recursive_mutex _mutex;
  ContentSourcePtr _source;
  std::unique_ptr<ChunkConsumer<Result>> _consumer;
  std::function<void(Result)> _onComplete;
  bool _done{false};
  bool _running{false};
  bool _rerun{false};
};

}  // namespace internal

// Non-blocking driver: reads 'source' from the calling thread as long as chunks are available, then continues from
// the thread invoking the source continuations. 'onComplete' is invoked exactly once with the result, unless the
// drain is cancelled first. The drain keeps itself (and the source) alive while a continuation is registered.
template <class Result>
DrainHandle DrainAsync(ContentSourcePtr source, std::unique_ptr<ChunkConsumer<Result>> consumer,
                       std::function<void(Result)> onComplete) {
  auto drain = std::make_shared<internal::AsyncDrain<Result>>(std::move(source), std::move(consumer),
                                                              std::move(onComplete));
  drain->run();
  return DrainHandle(std::move(drain));
}

}  // namespace contentflow
