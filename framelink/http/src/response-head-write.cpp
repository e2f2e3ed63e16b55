#include "framelink/response-head-write.hpp"

#include <cassert>
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include "framelink/buffered-sink.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"

namespace framelink::http {

void WriteResponseHead(BufferedSink& sink, Version version, StatusCode status, const HeaderMap& headers) {
  const std::string_view versionStr = VersionToStr(version);
  const std::string_view reason = ReasonPhraseFor(status);

  std::size_t headSize = versionStr.size() + 1U + 3U + 1U + reason.size() + CRLF.size() + CRLF.size();
  for (const Header& header : headers) {
    headSize += header.name.size() + HeaderSep.size() + header.value.size() + CRLF.size();
  }

  std::string head;
  head.reserve(headSize);
  head.append(versionStr);
  head.push_back(' ');
  char statusBuf[8];
  const auto res = std::to_chars(statusBuf, statusBuf + sizeof(statusBuf), status);
  assert(res.ec == std::errc());
  head.append(statusBuf, res.ptr);
  head.push_back(' ');
  head.append(reason);
  head.append(CRLF);
  for (const Header& header : headers) {
    head.append(header.name);
    head.append(HeaderSep);
    head.append(header.value);
    head.append(CRLF);
  }
  head.append(CRLF);

  sink.append(head);
}

}  // namespace framelink::http
