#include "contentflow/async-content-source.hpp"

#include <functional>
#include <mutex>
#include <string_view>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/log.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

bool AsyncContentSource::write(std::string_view bytes, bool last) { return write(RawChars(bytes), last); }

bool AsyncContentSource::write(RawChars bytes, bool last) {
  std::function<void()> onAvailable;
  {
    std::scoped_lock lock(_mutex);
    if (_closed || _terminal.isFailure()) {
      log::debug("AsyncContentSource - dropping {} bytes written after end of stream", bytes.size());
      return false;
    }
    if (!bytes.empty()) {
      _pending.push_back(std::move(bytes));
    }
    _closed = last;
    onAvailable = takeDemand();
  }
  if (onAvailable) {
    onAvailable();
  }
  return true;
}

void AsyncContentSource::close() {
  std::function<void()> onAvailable;
  {
    std::scoped_lock lock(_mutex);
    if (_closed) {
      return;
    }
    _closed = true;
    onAvailable = takeDemand();
  }
  if (onAvailable) {
    onAvailable();
  }
}

Chunk AsyncContentSource::read() {
  std::scoped_lock lock(_mutex);
  if (_terminal.reached()) {
    return _terminal.chunk();
  }
  if (!_pending.empty()) {
    RawChars bytes = std::move(_pending.front());
    _pending.pop_front();
    const bool last = _pending.empty() && _closed;
    if (last) {
      _terminal.setEof();
    }
    return Chunk::Data(std::move(bytes), last);
  }
  if (_closed) {
    _terminal.setEof();
    return Chunk::Eof();
  }
  return Chunk::Empty();
}

void AsyncContentSource::demand(std::function<void()> onAvailable) {
  {
    std::scoped_lock lock(_mutex);
    if (_pending.empty() && !_closed && !_terminal.reached()) {
      _onAvailable = std::move(onAvailable);
      return;
    }
  }
  onAvailable();
}

void AsyncContentSource::fail(ContentFailure failure) {
  std::function<void()> onAvailable;
  {
    std::scoped_lock lock(_mutex);
    if (_terminal.reached()) {
      return;
    }
    _terminal.setFailure(failure);
    _pending.clear();
    onAvailable = takeDemand();
  }
  if (onAvailable) {
    onAvailable();
  }
}

bool AsyncContentSource::failed() const {
  std::scoped_lock lock(_mutex);
  return _terminal.isFailure();
}

std::function<void()> AsyncContentSource::takeDemand() { return std::exchange(_onAvailable, nullptr); }

}  // namespace contentflow
