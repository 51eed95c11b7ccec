#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

#include "contentflow/content-failure.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

// One bounded unit of a byte stream plus an end-of-stream marker.
//
// A chunk has one of these shapes:
//  - data: owned bytes (RawChars) or a borrowed view with a release callback, last or not
//  - Empty: no bytes, not last. Means "nothing available yet, try again after demand()"
//  - Eof: no bytes, last
//  - Failure: terminal chunk carrying a ContentFailure (always last)
//
// A Chunk is move-only. Its bytes are released exactly once, either explicitly with release() or
// by the destructor, and a moved-from chunk owns nothing. After release, bytes() is empty.
class Chunk {
 public:
  static Chunk Data(RawChars bytes, bool last = false);

  // 'onRelease' is invoked exactly once, when the chunk is released or destroyed. It may be empty.
  static Chunk Borrowed(std::string_view bytes, bool last, std::function<void()> onRelease);

  static Chunk Empty() noexcept { return {}; }

  static Chunk Eof() noexcept;

  static Chunk Failure(ContentFailure failure) noexcept;

  Chunk() noexcept = default;

  Chunk(const Chunk&) = delete;
  Chunk(Chunk&& other) noexcept;
  Chunk& operator=(const Chunk&) = delete;
  Chunk& operator=(Chunk&& other) noexcept;

  ~Chunk() { release(); }

  [[nodiscard]] std::string_view bytes() const noexcept { return _owned.empty() ? _view : std::string_view(_owned); }

  [[nodiscard]] std::size_t size() const noexcept { return bytes().size(); }

  [[nodiscard]] bool isLast() const noexcept { return _last; }

  [[nodiscard]] bool isEmpty() const noexcept { return !_last && bytes().empty(); }

  [[nodiscard]] bool isFailure() const noexcept { return _failure.has_value(); }

  // Precondition: isFailure()
  [[nodiscard]] const ContentFailure& failure() const noexcept { return *_failure; }

  [[nodiscard]] bool released() const noexcept { return _released; }

  // Releases the bytes held by this chunk. Calling it more than once is a no-op.
  void release() noexcept;

 private:
  RawChars _owned;
  std::string_view _view;
  std::function<void()> _onRelease;
  std::optional<ContentFailure> _failure;
  bool _last{false};
  bool _released{false};
};

}  // namespace contentflow
