#include "framelink/request-head-parser.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "framelink/header-map.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"

namespace framelink::http {

namespace {

constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// tchar as defined in RFC 7230 section 3.2.6
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

std::string_view TrimHeaderWhitespace(std::string_view value) {
  while (!value.empty() && IsHeaderWhitespace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsHeaderWhitespace(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

StatusCode NeedMoreOrTooLarge(std::string_view buffer, std::size_t maxHeaderBytes) {
  return buffer.size() > maxHeaderBytes ? StatusCodeRequestHeaderFieldsTooLarge : kStatusNeedMoreData;
}

}  // namespace

StatusCode ParseRequestHead(std::string_view buffer, std::size_t maxHeaderBytes, RequestHead& head,
                            std::size_t& headSize) {
  head.headers.clear();

  std::size_t lineEnd = buffer.find(CRLF);
  if (lineEnd == std::string_view::npos) {
    return NeedMoreOrTooLarge(buffer, maxHeaderBytes);
  }
  if (lineEnd + CRLF.size() > maxHeaderBytes) {
    return StatusCodeRequestHeaderFieldsTooLarge;
  }
  const std::string_view requestLine = buffer.substr(0, lineEnd);
  if (requestLine.size() < kHttpReqLineMinLen - CRLF.size()) {
    return StatusCodeBadRequest;
  }

  // Method
  const auto methodEnd = requestLine.find(' ');
  if (methodEnd == std::string_view::npos || methodEnd == 0 ||
      !std::ranges::all_of(requestLine.substr(0, methodEnd), IsTokenChar)) {
    return StatusCodeBadRequest;
  }

  // Target
  const auto targetEnd = requestLine.find(' ', methodEnd + 1);
  if (targetEnd == std::string_view::npos || targetEnd == methodEnd + 1) {
    return StatusCodeBadRequest;
  }

  // Version
  int major = 0;
  const auto optVersion = ParseVersion(requestLine.substr(targetEnd + 1), &major);
  if (!optVersion) {
    return StatusCodeBadRequest;
  }
  if (major != 1) {
    return StatusCodeHTTPVersionNotSupported;
  }

  head.method.assign(requestLine.substr(0, methodEnd));
  head.target.assign(requestLine.substr(methodEnd + 1, targetEnd - methodEnd - 1));
  head.version = *optVersion;

  // Headers
  for (std::size_t pos = lineEnd + CRLF.size();; pos = lineEnd + CRLF.size()) {
    lineEnd = buffer.find(CRLF, pos);
    if (lineEnd == std::string_view::npos) {
      return NeedMoreOrTooLarge(buffer, maxHeaderBytes);
    }
    if (lineEnd + CRLF.size() > maxHeaderBytes) {
      return StatusCodeRequestHeaderFieldsTooLarge;
    }
    if (lineEnd == pos) {
      // empty line - end of headers
      headSize = pos + CRLF.size();
      return StatusCodeOK;
    }
    const std::string_view line = buffer.substr(pos, lineEnd - pos);
    if (IsHeaderWhitespace(line.front())) {
      // obsolete line folding (RFC 7230 section 3.2.4)
      return StatusCodeBadRequest;
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0) {
      return StatusCodeBadRequest;
    }
    const std::string_view name = line.substr(0, colonPos);
    if (!std::ranges::all_of(name, IsTokenChar)) {
      return StatusCodeBadRequest;
    }
    head.headers.add(name, TrimHeaderWhitespace(line.substr(colonPos + 1)));
  }
}

}  // namespace framelink::http
