#pragma once

#include <cstddef>
#include <string_view>

namespace contentflow {

// Move-only growable byte buffer holding chunk payloads and codec buffers.
// Decompression engines write directly into its spare capacity (see availableCapacity() and addSize()).
class RawChars {
 public:
  RawChars() noexcept = default;

  explicit RawChars(std::string_view data);

  RawChars(const RawChars &) = delete;
  RawChars(RawChars &&rhs) noexcept;
  RawChars &operator=(const RawChars &) = delete;
  RawChars &operator=(RawChars &&rhs) noexcept;

  ~RawChars();

  // Appends 'data' without checking capacity, which must have been reserved beforehand.
  void unchecked_append(std::string_view data);

  // Appends 'data', growing the buffer exponentially if needed.
  void append(std::string_view data);

  // Records 'delta' bytes written by a third party in the spare capacity.
  void addSize(std::size_t delta);

  void reserve(std::size_t newCapacity);

  void clear() noexcept { _size = 0; }

  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  [[nodiscard]] std::size_t availableCapacity() const noexcept { return _capacity - _size; }

  [[nodiscard]] char *data() noexcept { return _buf; }
  [[nodiscard]] const char *data() const noexcept { return _buf; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  operator std::string_view() const noexcept { return {_buf, _size}; }

 private:
  void grow(std::size_t newCapacity);

  char *_buf = nullptr;
  std::size_t _size = 0;
  std::size_t _capacity = 0;
};

}  // namespace contentflow
