#include "framelink/connection-persistence.hpp"

#include "framelink/header-map.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/http-version.hpp"
#include "framelink/string-equal-ignore-case.hpp"

namespace framelink::http {

bool IsPersistentConnection(Version version, const HeaderMap& requestHeaders) noexcept {
  const auto connection = requestHeaders.first(Connection);
  switch (version) {
    case Version::Http11:
      return !connection || !CaseInsensitiveEqual(*connection, close);
    case Version::Http10:
      return connection && CaseInsensitiveEqual(*connection, keepalive);
    default:
      return false;
  }
}

}  // namespace framelink::http
