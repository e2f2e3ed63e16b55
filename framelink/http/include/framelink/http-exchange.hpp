#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "framelink/body-reader.hpp"
#include "framelink/body-writer.hpp"
#include "framelink/buffered-sink.hpp"
#include "framelink/buffered-source.hpp"
#include "framelink/framing-decision.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"
#include "framelink/request-framing.hpp"
#include "framelink/request-head-parser.hpp"
#include "framelink/response-framing.hpp"

namespace framelink::http {

enum class BodyBufferStatus : std::uint8_t {
  Ready,      // whole body buffered, request terminated
  NeedMore,   // waiting for more bytes from the peer
  TooLarge,   // body exceeds the allowed size, nothing more is buffered
  Malformed,  // invalid chunked framing
  Error       // peer closed the connection in the middle of the body, or transport error
};

// State of one request / response cycle of a connection.
// It holds the parsed request head, the framed views of the request body and of the response body, and the
// persistence flag shared by both negotiation phases (it can only go from true to false).
// The 'request terminated' and 'response terminated' signals are each raised at most once.
// Callbacks given to the body reader and writer refer to this object, so it cannot be copied nor moved.
class HttpExchange {
 public:
  HttpExchange(RequestHead head, BufferedSource& source, BufferedSink& sink);

  HttpExchange(const HttpExchange&) = delete;
  HttpExchange(HttpExchange&&) = delete;
  HttpExchange& operator=(const HttpExchange&) = delete;
  HttpExchange& operator=(HttpExchange&&) = delete;

  ~HttpExchange() = default;

  // Negotiate the request body framing from the request headers and install the request body reader.
  // Must be called once, before the request is handed to a handler.
  FramingStatus negotiateRequest(bool persistent, std::size_t maxChunkSizeLineBytes);

  // ---------- Request ----------

  [[nodiscard]] Version version() const noexcept { return _head.version; }
  [[nodiscard]] std::string_view method() const noexcept { return _head.method; }
  [[nodiscard]] std::string_view target() const noexcept { return _head.target; }
  [[nodiscard]] const HeaderMap& requestHeaders() const noexcept { return _head.headers; }

  [[nodiscard]] const RequestFraming& requestFraming() const noexcept { return _requestFraming; }

  // Read the request body into memory until its end, without waiting for the transport.
  // Can be called again after NeedMore. Once Ready, readBody() serves the buffered bytes.
  BodyBufferStatus bufferBody(std::size_t maxBodyBytes);

  // Read request body bytes, without ever going past the end of the body.
  // A fatal status (Malformed, PrematureEnd, IoError) makes the connection non persistent.
  BodyReadResult readBody(std::span<char> out);

  // Append all the request body bytes that can be read without waiting to 'out'.
  // Returns the status of the last read: End, WouldBlock, or a fatal status.
  BodyReadStatus readAvailableBody(std::string& out);

  [[nodiscard]] BodyReader& bodyReader() noexcept { return _bodyReader; }

  // ---------- Response ----------

  // Status code of the response. Ignored once the response head has been written.
  void status(StatusCode statusCode);

  [[nodiscard]] StatusCode status() const noexcept { return _status; }

  // Response header fields, which may be modified until the response head is written.
  [[nodiscard]] HeaderMap& responseHeaders() noexcept { return _responseHeaders; }

  // Convenience to set the Content-Length of the response.
  void contentLength(std::size_t length);

  // Write response body bytes. The first call negotiates the response framing, advertises it in the response
  // headers and writes the response head.
  BodyWriteStatus write(std::string_view data);

  // Write the optional last body bytes and finish the response.
  // A fixed-length body that does not reach its declared length results in BodyWriteStatus::ShortWrite.
  BodyWriteStatus end(std::string_view data = {});

  [[nodiscard]] bool headSent() const noexcept { return _responseFraming.has_value(); }

  // Negotiated response framing, once the response head has been written.
  [[nodiscard]] const std::optional<ResponseFraming>& responseFraming() const noexcept { return _responseFraming; }

  [[nodiscard]] const BodyWriter& bodyWriter() const noexcept { return _bodyWriter; }

  // ---------- Lifecycle ----------

  // Signal the end of the request. Only the first call has an effect.
  void terminateRequest();

  [[nodiscard]] bool requestTerminated() const noexcept { return _requestTerminated; }

  [[nodiscard]] bool responseTerminated() const noexcept { return _responseTerminated; }

  // Whether the connection may be reused after this exchange. Final once the response head is written.
  [[nodiscard]] bool persistent() const noexcept { return _persistent; }

  // Forbid the reuse of the connection (the response advertises it if its head is not written yet).
  void downgradePersistence() noexcept { _persistent = false; }

  // True if the connection cannot deliver a consistent response anymore and must be dropped immediately,
  // without sending the pending output (malformed response length, fixed-length short write).
  [[nodiscard]] bool broken() const noexcept { return _broken; }

  // The response cannot be completed consistently anymore (its head is already out).
  void markBroken() noexcept {
    _persistent = false;
    _broken = true;
  }

 private:
  BodyReadResult readFromSource(std::span<char> out);

  BodyWriteStatus commitHead();

  void terminateResponse();

  RequestHead _head;
  BufferedSource* _pSource;
  BufferedSink* _pSink;
  RequestFraming _requestFraming;
  BodyReader _bodyReader;
  std::string _body;
  std::size_t _bodyPos{0};
  bool _bodyBuffered{false};

  HeaderMap _responseHeaders;
  std::optional<ResponseFraming> _responseFraming;
  BodyWriter _bodyWriter;
  StatusCode _status{StatusCodeOK};

  bool _persistent{false};
  bool _requestTerminated{false};
  bool _responseTerminated{false};
  bool _broken{false};
};

}  // namespace framelink::http
