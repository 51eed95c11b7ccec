#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <iterator>
#include <utility>

namespace contentflow {

// Exception with inline message storage, so that throwing never allocates.
// Messages longer than kMsgMaxLen are truncated and terminated by "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto ret = std::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (static_cast<std::size_t>(ret.size) > kMsgMaxLen) {
      std::ranges::fill(std::end(_data) - 4, std::end(_data) - 1, '.');
      _data[kMsgMaxLen] = '\0';
    } else {
      *ret.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace contentflow
