#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <variant>

#include "framelink/buffered-sink.hpp"
#include "framelink/framing-decision.hpp"

namespace framelink::http {

enum class BodyWriteStatus : std::uint8_t {
  Ok,
  Overflow,         // write would exceed the declared Content-Length, nothing written
  ShortWrite,       // fixed-length body closed before the declared length was reached
  AlreadyClosed,    // body already closed
  MalformedLength,  // response Content-Length cannot be parsed, no framing possible
};

std::string_view BodyWriteStatusName(BodyWriteStatus status) noexcept;

// Framed view of the response body over the raw connection sink, built once from the response
// FramingDecision. Encoded bytes are appended to the sink, flushing is left to the connection.
//  - Empty: body bytes are discarded (HEAD, 1xx, 204, 304)
//  - FixedLength: writes past the declared length are refused
//  - Chunked: each non empty write becomes one chunk, close() emits the terminating chunk
//  - Identity: bytes are passed through, the end of body is the end of the connection
// The completion callback is invoked exactly once at end of body: on close(), or for a fixed length body
// as soon as the declared length has been written.
class BodyWriter {
 public:
  using CompletionCallback = std::function<void()>;

  BodyWriter() noexcept = default;

  BodyWriter(const FramingDecision& decision, CompletionCallback onEnd);

  BodyWriteStatus write(BufferedSink& sink, std::string_view data);

  // Finish the body. For a fixed-length body not completely written, returns BodyWriteStatus::ShortWrite:
  // the message boundary is lost and the connection must not be reused.
  BodyWriteStatus close(BufferedSink& sink);

  [[nodiscard]] bool closed() const noexcept { return _closed; }

  // True once the end of body has been reached (callback invoked).
  [[nodiscard]] bool ended() const noexcept { return _ended; }

  // Payload bytes accepted so far (framing overhead excluded).
  [[nodiscard]] std::size_t bytesWritten() const noexcept { return _bytesWritten; }

  // Remaining bytes of a fixed-length body, std::nullopt for other framings.
  [[nodiscard]] std::optional<std::size_t> remaining() const noexcept;

  [[nodiscard]] std::string_view framingName() const noexcept;

 private:
  struct EmptyState {};

  struct FixedLengthState {
    std::size_t remaining;
  };

  struct ChunkedState {};

  struct IdentityState {};

  void end();

  std::variant<EmptyState, FixedLengthState, ChunkedState, IdentityState> _state;
  CompletionCallback _onEnd;
  std::size_t _bytesWritten{0};
  bool _closed{false};
  bool _ended{false};
};

}  // namespace framelink::http
