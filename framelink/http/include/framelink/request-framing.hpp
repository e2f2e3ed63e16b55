#pragma once

#include <optional>

#include "framelink/framing-decision.hpp"
#include "framelink/header-map.hpp"

namespace framelink::http {

// Outcome of the request body framing negotiation.
struct RequestFraming {
  // std::nullopt when no decision is made: the connection is not persistent and carries no length header,
  // or the body is 'Transfer-Encoding: identity' (indeterminate length). The raw stream is then used as is.
  std::optional<FramingDecision> decision;

  // Persistence after negotiation. Never true if the input flag was false.
  bool persistent{false};

  // The request has no body to read: it is terminated as soon as it is dispatched.
  bool terminateImmediately{false};

  // Whether a limiting reader must be installed over the raw stream (and a drain scheduled if the
  // handler leaves some of it unread).
  bool installWrapper{false};

  FramingStatus status{FramingStatus::Ok};
};

// Decide how the request body is delimited (RFC 2616 §4.4), first match wins:
//  1. Transfer-Encoding other than identity -> Chunked (last occurrence governs)
//  2. Content-Length (first occurrence governs) -> Empty if 0, FixedLength otherwise.
//     The limiting reader is only installed on persistent connections.
//  3. Transfer-Encoding: identity -> body until close, persistence downgraded
//  4. no length header on a persistent connection -> Empty
//  5. no length header on a non persistent connection -> no decision
// A Content-Length that is not a non-negative integer yields FramingStatus::MalformedLength.
[[nodiscard]] RequestFraming NegotiateRequestFraming(const HeaderMap& requestHeaders, bool persistent);

}  // namespace framelink::http
