#pragma once

#include "framelink/buffered-sink.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"

namespace framelink::http {

// Append the status line, the header fields and the empty line ending the head of a response to the sink.
void WriteResponseHead(BufferedSink& sink, Version version, StatusCode status, const HeaderMap& headers);

}  // namespace framelink::http
