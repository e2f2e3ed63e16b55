#pragma once

#include <string_view>

#include "framelink/framing-decision.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"

namespace framelink::http {

struct ResponseFraming {
  FramingDecision decision;
  // Final persistence of the connection, already advertised in the response headers.
  bool persistent{false};
  FramingStatus status{FramingStatus::Ok};
};

// Decide how the response body is delimited and apply the required header mutations in place.
// Rules, first match wins:
//  1. HEAD request, 1xx, 204 or 304 status -> Empty, whatever the headers
//  2. Transfer-Encoding present: honored on HTTP/1.1 (Chunked unless identity), removed on other versions
//  3. HTTP/1.1 without Content-Length -> 'Transfer-Encoding: chunked' added, Chunked
//  4. Content-Length -> FixedLength
//  5. otherwise -> Identity (close-delimited), persistence downgraded
// The Connection header is then adjusted to advertise the final persistence, unless the Content-Length
// is malformed (FramingStatus::MalformedLength): no framing can be trusted and the connection must be dropped.
[[nodiscard]] ResponseFraming NegotiateResponseFraming(Version version, std::string_view method, StatusCode status,
                                                       HeaderMap& responseHeaders, bool persistent);

}  // namespace framelink::http
