#pragma once

#include <cstddef>
#include <string_view>

namespace framelink {

// ASCII only lower-casing, locale independent. HTTP tokens are ASCII.
constexpr char ToLowerAscii(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch - 'A' + 'a');
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (ToLowerAscii(lhs[pos]) != ToLowerAscii(rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace framelink
