#pragma once

#include <cstddef>
#include <string_view>

namespace framelink::http {

// Header field names are case-insensitive (RFC 7230). They are stored here in their canonical form
// for emission; lookups always go through case-insensitive comparison. Token values are kept
// lowercase for the same reason.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods that matter for framing decisions
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";

// Header names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";

// Header values
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

// Terminating chunk of a chunked body without trailers.
inline constexpr std::string_view kLastChunk = "0\r\n\r\n";

// Minimal request-line: "GET / HTTP/1.1\r\n"
inline constexpr std::size_t kHttpReqLineMinLen = GET.size() + 3UL + HTTP11Sv.size() + CRLF.size();

}  // namespace framelink::http
