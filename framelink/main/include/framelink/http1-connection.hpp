#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "framelink/buffered-sink.hpp"
#include "framelink/buffered-source.hpp"
#include "framelink/drain-coordinator.hpp"
#include "framelink/handler-chain.hpp"
#include "framelink/http-exchange.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/request-head-parser.hpp"
#include "framelink/server-config.hpp"
#include "framelink/transport.hpp"

namespace framelink {

// HTTP/1.x protocol state of one client connection, driven by readiness events.
// A request body with a known end is buffered before the handlers run, so they see it whole.
// Requests are served strictly in order: the head of a pipelined request is only parsed once the previous
// request has been terminated (its body consumed or drained), its response terminated and all the response
// bytes flushed to the transport.
class Http1Connection {
 public:
  // What the connection needs before it can make progress again.
  enum class Action : std::uint8_t { WaitReadable, WaitWritable, WaitReadWrite, Close };

  // The transport, the config and the handlers must outlive the connection.
  Http1Connection(ITransport& transport, const ServerConfig& config, const HandlerChain& handlers);

  Http1Connection(const Http1Connection&) = delete;
  Http1Connection(Http1Connection&&) = delete;
  Http1Connection& operator=(const Http1Connection&) = delete;
  Http1Connection& operator=(Http1Connection&&) = delete;

  ~Http1Connection() = default;

  // Make as much progress as possible (parse, buffer, dispatch, drain, flush) without blocking.
  Action process();

  // Number of requests dispatched on this connection so far.
  [[nodiscard]] uint32_t nbRequests() const noexcept { return _nbRequests; }

  [[nodiscard]] bool closed() const noexcept { return _state == State::Closed; }

 private:
  enum class State : std::uint8_t {
    ReadingHead,  // waiting for a complete request head
    ReadingBody,  // buffering a request body before dispatching it
    Finishing,    // handler returned: draining the request body and flushing the response
    Closing,      // flushing a final error response before closing
    Closed
  };

  Action readHead();
  void startExchange(http::RequestHead head);
  Action readBody();
  void dispatch(http::HttpExchange& exchange);
  void completeExchange(http::HttpExchange& exchange);
  void replyWithoutHandler(http::HttpExchange& exchange, http::StatusCode statusCode);
  Action finishExchange();
  Action flushThenClose();
  void emitSimpleError(http::StatusCode statusCode);
  Action closeNow(std::string_view reason);

  const ServerConfig* _pConfig;
  const HandlerChain* _pHandlers;
  BufferedSource _source;
  BufferedSink _sink;
  http::DrainCoordinator _drain;
  std::optional<http::HttpExchange> _exchange;
  uint32_t _nbRequests{0};
  State _state{State::ReadingHead};
};

}  // namespace framelink
