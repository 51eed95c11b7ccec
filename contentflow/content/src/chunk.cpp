#include "contentflow/chunk.hpp"

#include <functional>
#include <string_view>
#include <utility>

#include "contentflow/content-failure.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

Chunk Chunk::Data(RawChars bytes, bool last) {
  Chunk chunk;
  chunk._owned = std::move(bytes);
  chunk._last = last;
  return chunk;
}

Chunk Chunk::Borrowed(std::string_view bytes, bool last, std::function<void()> onRelease) {
  Chunk chunk;
  chunk._view = bytes;
  chunk._onRelease = std::move(onRelease);
  chunk._last = last;
  return chunk;
}

Chunk Chunk::Eof() noexcept {
  Chunk chunk;
  chunk._last = true;
  return chunk;
}

Chunk Chunk::Failure(ContentFailure failure) noexcept {
  Chunk chunk;
  chunk._failure = failure;
  chunk._last = true;
  return chunk;
}

Chunk::Chunk(Chunk&& other) noexcept
    : _owned(std::move(other._owned)),
      _view(std::exchange(other._view, {})),
      _onRelease(std::exchange(other._onRelease, nullptr)),
      _failure(other._failure),
      _last(other._last),
      _released(std::exchange(other._released, true)) {}

Chunk& Chunk::operator=(Chunk&& other) noexcept {
  if (this != &other) [[likely]] {
    release();
    _owned = std::move(other._owned);
    _view = std::exchange(other._view, {});
    _onRelease = std::exchange(other._onRelease, nullptr);
    _failure = other._failure;
    _last = other._last;
    _released = std::exchange(other._released, true);
  }
  return *this;
}

void Chunk::release() noexcept {
  if (_released) {
    return;
  }
  _released = true;
  _owned = RawChars();
  _view = {};
  if (_onRelease) {
    auto onRelease = std::exchange(_onRelease, nullptr);
    onRelease();
  }
}

}  // namespace contentflow
