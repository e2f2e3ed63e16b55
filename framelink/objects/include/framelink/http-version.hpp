#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace framelink::http {

// Protocol versions relevant to message framing. Anything that is a well formed HTTP/1.x token
// but neither 1.0 nor 1.1 is reported as Other (never persistent).
enum class Version : std::uint8_t { Http10, Http11, Other };

// Parse a textual HTTP version token (e.g. "HTTP/1.1").
// Returns std::nullopt if the token is not of the form "HTTP/<digits>.<digits>".
// Sets 'majorOut' to the parsed major number when provided, so callers can reject non 1.x majors.
std::optional<Version> ParseVersion(std::string_view token, int* majorOut = nullptr);

// Version token used when writing a status line. Other versions are answered as HTTP/1.1.
std::string_view VersionToStr(Version version) noexcept;

}  // namespace framelink::http
