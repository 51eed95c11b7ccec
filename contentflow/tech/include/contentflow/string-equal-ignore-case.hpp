#pragma once

#include <string_view>

namespace contentflow {

constexpr char tolower(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch = static_cast<char>(static_cast<unsigned char>(ch) | 0x20U);
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

}  // namespace contentflow
