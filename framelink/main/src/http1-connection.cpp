#include "framelink/http1-connection.hpp"

#include <cstddef>
#include <exception>
#include <string_view>
#include <utility>

#include "framelink/buffered-sink.hpp"
#include "framelink/buffered-source.hpp"
#include "framelink/connection-persistence.hpp"
#include "framelink/drain-coordinator.hpp"
#include "framelink/framing-decision.hpp"
#include "framelink/handler-chain.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/http-exchange.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"
#include "framelink/log.hpp"
#include "framelink/request-head-parser.hpp"
#include "framelink/response-head-write.hpp"
#include "framelink/server-config.hpp"
#include "framelink/transport.hpp"

namespace framelink {

Http1Connection::Http1Connection(ITransport& transport, const ServerConfig& config, const HandlerChain& handlers)
    : _pConfig(&config),
      _pHandlers(&handlers),
      _source(transport, config.readChunkBytes),
      _sink(transport),
      _drain(config.readChunkBytes) {}

Http1Connection::Action Http1Connection::process() {
  while (true) {
    switch (_state) {
      case State::ReadingHead: {
        const auto action = readHead();
        if (_state == State::ReadingHead) {
          return action;
        }
        break;
      }
      case State::ReadingBody: {
        const auto action = readBody();
        if (_state == State::ReadingBody) {
          return action;
        }
        break;
      }
      case State::Finishing: {
        const auto action = finishExchange();
        if (_state == State::Finishing || _state == State::Closed) {
          return action;
        }
        break;
      }
      case State::Closing:
        return flushThenClose();
      default:
        return Action::Close;
    }
  }
}

Http1Connection::Action Http1Connection::readHead() {
  while (true) {
    http::RequestHead head;
    std::size_t headSize = 0;
    const auto statusCode = http::ParseRequestHead(_source.buffered(), _pConfig->maxHeaderBytes, head, headSize);
    if (statusCode == http::StatusCodeOK) {
      _source.consume(headSize);
      startExchange(std::move(head));
      return Action::WaitReadable;
    }
    if (statusCode != http::kStatusNeedMoreData) {
      log::warn("Invalid request head, replying {}", statusCode);
      emitSimpleError(statusCode);
      _state = State::Closing;
      return Action::WaitWritable;
    }
    switch (_source.fill()) {
      case BufferedSource::FillStatus::Data:
        break;
      case BufferedSource::FillStatus::WouldBlock:
        return Action::WaitReadable;
      case BufferedSource::FillStatus::Eof:
        if (!_source.empty()) {
          log::debug("Peer closed the connection with {} bytes of incomplete request head", _source.size());
        }
        return closeNow("peer closed");
      default:
        return closeNow("read error");
    }
  }
}

void Http1Connection::startExchange(http::RequestHead head) {
  ++_nbRequests;
  auto& exchange = _exchange.emplace(std::move(head), _source, _sink);

  bool persistent =
      _pConfig->enableKeepAlive && http::IsPersistentConnection(exchange.version(), exchange.requestHeaders());
  if (_pConfig->maxRequestsPerConnection != 0 && _nbRequests >= _pConfig->maxRequestsPerConnection) {
    persistent = false;
  }

  if (exchange.negotiateRequest(persistent, _pConfig->maxChunkSizeLineBytes) != FramingStatus::Ok) {
    // The request body boundary is unknown, the stream cannot be resynchronized.
    log::warn("{} {} has a malformed Content-Length, dropping connection", exchange.method(), exchange.target());
    _exchange.reset();
    closeNow("malformed request length");
    return;
  }

  if (!exchange.requestTerminated() && exchange.bodyReader().bounded()) {
    _state = State::ReadingBody;
    return;
  }

  dispatch(exchange);
  completeExchange(exchange);
}

Http1Connection::Action Http1Connection::readBody() {
  auto& exchange = *_exchange;
  switch (exchange.bufferBody(_pConfig->maxBodyBytes)) {
    case http::BodyBufferStatus::Ready:
      dispatch(exchange);
      completeExchange(exchange);
      return Action::WaitReadable;
    case http::BodyBufferStatus::NeedMore:
      return Action::WaitReadable;
    case http::BodyBufferStatus::TooLarge:
      log::warn("{} {} body exceeds {} bytes", exchange.method(), exchange.target(), _pConfig->maxBodyBytes);
      replyWithoutHandler(exchange, http::StatusCodePayloadTooLarge);
      return Action::WaitReadable;
    case http::BodyBufferStatus::Malformed:
      log::warn("{} {} has a malformed chunked body", exchange.method(), exchange.target());
      replyWithoutHandler(exchange, http::StatusCodeBadRequest);
      return Action::WaitReadable;
    default:
      _exchange.reset();
      return closeNow("request body read failure");
  }
}

void Http1Connection::replyWithoutHandler(http::HttpExchange& exchange, http::StatusCode statusCode) {
  exchange.status(statusCode);
  exchange.contentLength(0);
  completeExchange(exchange);
}

void Http1Connection::completeExchange(http::HttpExchange& exchange) {
  if (!exchange.broken() && !exchange.bodyWriter().closed()) {
    exchange.end();
  }
  if (exchange.broken()) {
    _exchange.reset();
    closeNow("inconsistent response framing");
    return;
  }

  if (!exchange.requestTerminated()) {
    if (!exchange.bodyReader().bounded()) {
      // Body delimited by the connection close: nothing to drain since the connection is not reused.
      exchange.terminateRequest();
    } else if (_drain.begin(exchange.bodyReader(), _source) == http::DrainStatus::Failed) {
      exchange.downgradePersistence();
    }
  }
  _state = State::Finishing;
}

void Http1Connection::dispatch(http::HttpExchange& exchange) {
  try {
    _pHandlers->dispatch(exchange);
  } catch (const std::exception& ex) {
    log::error("{} {} handler failed: {}", exchange.method(), exchange.target(), ex.what());
    if (exchange.headSent()) {
      // Head already sent: drop the connection without terminating the body.
      exchange.markBroken();
      return;
    }
    exchange.downgradePersistence();
    exchange.responseHeaders().clear();
    exchange.status(http::StatusCodeInternalServerError);
    exchange.contentLength(0);
  }
}

Http1Connection::Action Http1Connection::finishExchange() {
  const auto flushStatus = _sink.flush();
  if (flushStatus == BufferedSink::FlushStatus::Error) {
    _drain.cancel();
    return closeNow("write error");
  }
  if (_drain.active() && _drain.resume(_source) == http::DrainStatus::Failed) {
    log::debug("Failed to drain request body after {} bytes", _drain.drainedBytes());
    _exchange->downgradePersistence();
  }
  if (_drain.active()) {
    return flushStatus == BufferedSink::FlushStatus::WouldBlock ? Action::WaitReadWrite : Action::WaitReadable;
  }
  if (flushStatus == BufferedSink::FlushStatus::WouldBlock) {
    return Action::WaitWritable;
  }

  // Request terminated, response terminated and flushed: the exchange is complete.
  const bool persistent = _exchange->persistent() && _exchange->requestTerminated();
  _exchange.reset();
  if (!persistent) {
    return closeNow("not persistent");
  }
  _state = State::ReadingHead;
  return Action::WaitReadable;
}

Http1Connection::Action Http1Connection::flushThenClose() {
  switch (_sink.flush()) {
    case BufferedSink::FlushStatus::WouldBlock:
      return Action::WaitWritable;
    case BufferedSink::FlushStatus::Done:
      return closeNow("error response sent");
    default:
      return closeNow("write error");
  }
}

void Http1Connection::emitSimpleError(http::StatusCode statusCode) {
  http::HeaderMap headers;
  headers.add(http::ContentLength, "0");
  headers.add(http::Connection, http::close);
  http::WriteResponseHead(_sink, http::Version::Http11, statusCode, headers);
}

Http1Connection::Action Http1Connection::closeNow(std::string_view reason) {
  log::debug("Closing connection after {} requests: {}", _nbRequests, reason);
  _state = State::Closed;
  return Action::Close;
}

}  // namespace framelink
