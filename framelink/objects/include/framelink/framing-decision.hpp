#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace framelink {

// Body runs until the connection is closed. Only produced for responses; forces a non persistent connection.
struct IdentityFraming {
  bool operator==(const IdentityFraming&) const noexcept = default;
};

// Exactly 'length' bytes of body.
struct FixedLengthFraming {
  std::size_t length{};

  bool operator==(const FixedLengthFraming&) const noexcept = default;
};

// Sequence of length-prefixed chunks terminated by a zero-size chunk.
struct ChunkedFraming {
  bool operator==(const ChunkedFraming&) const noexcept = default;
};

// Zero-length body, no bytes consumed from or written to the wire.
struct EmptyFraming {
  bool operator==(const EmptyFraming&) const noexcept = default;
};

// Closed set of message body delimitation strategies (RFC 2616 §4.4).
// Computed once per direction per exchange, immutable afterwards.
using FramingDecision = std::variant<EmptyFraming, FixedLengthFraming, ChunkedFraming, IdentityFraming>;

enum class FramingStatus : std::uint8_t { Ok, MalformedLength };

std::string_view FramingName(const FramingDecision& decision) noexcept;

std::string_view FramingStatusName(FramingStatus status) noexcept;

// Parse a Content-Length value as a non-negative decimal integer.
// Optional surrounding whitespace is tolerated, anything else (sign, empty, overflow, trailing garbage)
// results in std::nullopt.
std::optional<std::size_t> ParseContentLength(std::string_view value) noexcept;

}  // namespace framelink
