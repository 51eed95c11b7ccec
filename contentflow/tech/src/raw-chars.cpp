#include "contentflow/raw-chars.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string_view>
#include <utility>

namespace contentflow {

RawChars::RawChars(std::string_view data) {
  if (!data.empty()) {
    grow(data.size());
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(RawChars &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::unchecked_append(std::string_view data) {
  assert(data.size() <= availableCapacity());
  if (!data.empty()) {
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void RawChars::append(std::string_view data) {
  if (availableCapacity() < data.size()) {
    const std::size_t required = _size + data.size();
    grow(std::max(required, 2U * _capacity));
  }
  unchecked_append(data);
}

void RawChars::addSize(std::size_t delta) {
  assert(delta <= availableCapacity());
  _size += delta;
}

void RawChars::reserve(std::size_t newCapacity) {
  if (_capacity < newCapacity) {
    grow(newCapacity);
  }
}

void RawChars::grow(std::size_t newCapacity) {
  auto *newBuf = static_cast<char *>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace contentflow
