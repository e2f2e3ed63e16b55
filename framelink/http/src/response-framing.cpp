#include "framelink/response-framing.hpp"

#include <optional>
#include <string_view>

#include "framelink/framing-decision.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"
#include "framelink/log.hpp"
#include "framelink/string-equal-ignore-case.hpp"

namespace framelink::http {

namespace {

void AdvertisePersistence(Version version, bool persistent, HeaderMap& responseHeaders) {
  if (persistent) {
    if (version == Version::Http11) {
      responseHeaders.erase(Connection);
    } else if (version == Version::Http10) {
      responseHeaders.set(Connection, keepalive);
    }
  } else if (version == Version::Http11) {
    responseHeaders.set(Connection, close);
  } else if (version == Version::Http10) {
    responseHeaders.erase(Connection);
  }
}

}  // namespace

ResponseFraming NegotiateResponseFraming(Version version, std::string_view method, StatusCode status,
                                         HeaderMap& responseHeaders, bool persistent) {
  ResponseFraming ret{IdentityFraming{}, persistent, FramingStatus::Ok};

  // Transfer-Encoding is an HTTP/1.1 feature (RFC 2616 §3.6), never sent to other versions.
  if (version != Version::Http11 && responseHeaders.erase(TransferEncoding) != 0) {
    log::debug("Removed Transfer-Encoding from {} response", VersionToStr(version));
  }

  std::optional<FramingDecision> decision;
  if (CaseInsensitiveEqual(method, HEAD) || IsBodylessStatus(status)) {
    decision = EmptyFraming{};
  } else if (const auto transferEncoding = responseHeaders.last(TransferEncoding)) {
    if (!CaseInsensitiveEqual(*transferEncoding, identity)) {
      decision = ChunkedFraming{};
    }
  } else if (version == Version::Http11 && !responseHeaders.contains(ContentLength)) {
    responseHeaders.add(TransferEncoding, chunked);
    decision = ChunkedFraming{};
  }

  if (!decision) {
    if (const auto contentLength = responseHeaders.first(ContentLength)) {
      const auto length = ParseContentLength(*contentLength);
      if (!length) {
        log::warn("Malformed response Content-Length '{}'", *contentLength);
        ret.persistent = false;
        ret.status = FramingStatus::MalformedLength;
        return ret;
      }
      decision = FixedLengthFraming{*length};
    } else {
      // close-delimited: the only way to mark the end of the body is to close the connection
      decision = IdentityFraming{};
      ret.persistent = false;
    }
  }

  ret.decision = *decision;
  AdvertisePersistence(version, ret.persistent, responseHeaders);
  log::debug("Response framing {} for status {} ({}persistent)", FramingName(ret.decision), status,
             ret.persistent ? "" : "non ");
  return ret;
}

}  // namespace framelink::http
