#include "framelink/http-version.hpp"

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

#include "framelink/http-constants.hpp"

namespace framelink::http {

namespace {

constexpr std::string_view kHttpPrefix = "HTTP/";

bool ParseDigits(const char* first, const char* last, int& out) {
  if (first == last) {
    return false;
  }
  const auto [ptr, errc] = std::from_chars(first, last, out);
  return errc == std::errc() && ptr == last;
}

}  // namespace

std::optional<Version> ParseVersion(std::string_view token, int* majorOut) {
  if (!token.starts_with(kHttpPrefix)) {
    return std::nullopt;
  }
  token.remove_prefix(kHttpPrefix.size());
  const auto dotPos = token.find('.');
  if (dotPos == std::string_view::npos) {
    return std::nullopt;
  }
  int major = 0;
  int minor = 0;
  if (!ParseDigits(token.data(), token.data() + dotPos, major) ||
      !ParseDigits(token.data() + dotPos + 1, token.data() + token.size(), minor)) {
    return std::nullopt;
  }
  if (majorOut != nullptr) {
    *majorOut = major;
  }
  if (major == 1 && minor == 1) {
    return Version::Http11;
  }
  if (major == 1 && minor == 0) {
    return Version::Http10;
  }
  return Version::Other;
}

std::string_view VersionToStr(Version version) noexcept {
  return version == Version::Http10 ? HTTP10Sv : HTTP11Sv;
}

}  // namespace framelink::http
