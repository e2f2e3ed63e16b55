#include "framelink/request-framing.hpp"

#include "framelink/framing-decision.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/log.hpp"
#include "framelink/string-equal-ignore-case.hpp"

namespace framelink::http {

RequestFraming NegotiateRequestFraming(const HeaderMap& requestHeaders, bool persistent) {
  RequestFraming ret;
  ret.persistent = persistent;

  const auto transferEncoding = requestHeaders.last(TransferEncoding);
  if (transferEncoding && !CaseInsensitiveEqual(*transferEncoding, identity)) {
    ret.decision = ChunkedFraming{};
    ret.installWrapper = true;
    return ret;
  }

  const auto contentLength = requestHeaders.first(ContentLength);
  if (contentLength) {
    const auto length = ParseContentLength(*contentLength);
    if (!length) {
      log::warn("Malformed request Content-Length '{}'", *contentLength);
      ret.persistent = false;
      ret.status = FramingStatus::MalformedLength;
      return ret;
    }
    if (*length == 0) {
      ret.decision = EmptyFraming{};
      ret.terminateImmediately = true;
    } else {
      ret.decision = FixedLengthFraming{*length};
      // draining is moot when the connection will be closed anyway
      ret.installWrapper = persistent;
    }
    return ret;
  }

  if (transferEncoding) {
    // identity: the end of the body is unknown, so the connection cannot be reused.
    log::debug("Request with 'Transfer-Encoding: identity', connection will not be reused");
    ret.persistent = false;
    return ret;
  }

  if (persistent) {
    ret.decision = EmptyFraming{};
    ret.terminateImmediately = true;
  }
  return ret;
}

}  // namespace framelink::http
