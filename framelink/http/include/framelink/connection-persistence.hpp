#pragma once

#include "framelink/header-map.hpp"
#include "framelink/http-version.hpp"

namespace framelink::http {

// Tells whether the connection carrying a request with given version and headers may be reused for a
// subsequent request. Only the first Connection header value is considered.
//  - HTTP/1.1: persistent unless 'Connection: close'
//  - HTTP/1.0: persistent only with 'Connection: keep-alive'
//  - other versions: never persistent
[[nodiscard]] bool IsPersistentConnection(Version version, const HeaderMap& requestHeaders) noexcept;

}  // namespace framelink::http
