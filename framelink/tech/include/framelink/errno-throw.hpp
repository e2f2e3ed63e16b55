#pragma once

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

namespace framelink {

// Capture errno immediately and throw std::system_error carrying the given context.
// Usage: throw_errno("bind failed");
[[noreturn]] inline void throw_errno(std::string_view context) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::generic_category()), std::string(context));
}

}  // namespace framelink
