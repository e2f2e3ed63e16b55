#include "framelink/framing-decision.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>
#include <variant>

namespace framelink {

namespace {

constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

struct FramingNameVisitor {
  std::string_view operator()(const EmptyFraming&) const noexcept { return "empty"; }
  std::string_view operator()(const FixedLengthFraming&) const noexcept { return "fixed-length"; }
  std::string_view operator()(const ChunkedFraming&) const noexcept { return "chunked"; }
  std::string_view operator()(const IdentityFraming&) const noexcept { return "identity"; }
};

}  // namespace

std::string_view FramingName(const FramingDecision& decision) noexcept {
  return std::visit(FramingNameVisitor{}, decision);
}

std::string_view FramingStatusName(FramingStatus status) noexcept {
  switch (status) {
    case FramingStatus::Ok:
      return "ok";
    case FramingStatus::MalformedLength:
      return "malformed-length";
    default:
      return "unknown";
  }
}

std::optional<std::size_t> ParseContentLength(std::string_view value) noexcept {
  while (!value.empty() && IsHeaderWhitespace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsHeaderWhitespace(value.back())) {
    value.remove_suffix(1);
  }
  // digits only: no sign, no empty value
  if (value.empty() || value.front() < '0' || value.front() > '9') {
    return std::nullopt;
  }
  std::size_t length = 0;
  const char* last = value.data() + value.size();
  const auto [ptr, errc] = std::from_chars(value.data(), last, length);
  if (errc != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return length;
}

}  // namespace framelink
