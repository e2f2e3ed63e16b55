#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "framelink/header-map.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"

namespace framelink::http {

// Request line and header fields of a request.
struct RequestHead {
  std::string method;
  std::string target;
  Version version{Version::Http11};
  HeaderMap headers;
};

// Returned by ParseRequestHead when the head is not complete yet.
inline constexpr StatusCode kStatusNeedMoreData = 0;

// Try to parse a complete request head at the beginning of 'buffer'.
// Returns:
//  - StatusCodeOK: 'head' is filled and 'headSize' is set to the number of bytes of the head, final empty line included
//  - kStatusNeedMoreData: the head is incomplete
//  - StatusCodeBadRequest: malformed request line or header line
//  - StatusCodeRequestHeaderFieldsTooLarge: head larger than 'maxHeaderBytes'
//  - StatusCodeHTTPVersionNotSupported: major version other than 1
StatusCode ParseRequestHead(std::string_view buffer, std::size_t maxHeaderBytes, RequestHead& head,
                            std::size_t& headSize);

}  // namespace framelink::http
