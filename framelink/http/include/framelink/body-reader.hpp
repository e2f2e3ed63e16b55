#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

#include "framelink/buffered-source.hpp"
#include "framelink/request-framing.hpp"

namespace framelink::http {

enum class BodyReadStatus : std::uint8_t {
  Data,          // bytes were produced, body not finished yet
  End,           // body fully consumed (the result may still carry its last bytes)
  WouldBlock,    // no byte available without waiting for the transport
  Malformed,     // invalid chunked framing, fatal for the connection
  PrematureEnd,  // peer closed the connection in the middle of the body, fatal for the connection
  IoError        // transport error, fatal for the connection
};

std::string_view BodyReadStatusName(BodyReadStatus status) noexcept;

struct BodyReadResult {
  std::size_t nbBytes;
  BodyReadStatus status;
};

// Framed view of the request body over the raw connection source.
// The active framing is a closed set of states dispatched in read():
//  - Empty: no byte is ever consumed from the source
//  - FixedLength: at most 'length' bytes are consumed
//  - Chunked: chunk-size lines, payloads and CRLFs are consumed up to the zero-size chunk and its
//    optional trailers (discarded)
//  - PassThrough: unlimited reads until the peer closes (no decision, or limit not installed)
// Bytes following the body are never consumed, so a pipelined request stays available in the source.
// The completion callback is invoked exactly once, when end of body is reached by a read.
// An Empty reader starts at end of body and never invokes it.
class BodyReader {
 public:
  using CompletionCallback = std::function<void()>;

  // Empty body.
  BodyReader() noexcept = default;

  // Reader enforcing the negotiated framing. 'maxChunkSizeLineBytes' bounds chunk-size and trailer lines.
  BodyReader(const RequestFraming& framing, std::size_t maxChunkSizeLineBytes, CompletionCallback onEnd);

  // Read at most out.size() body bytes into 'out'. 'out' should not be empty.
  BodyReadResult read(BufferedSource& source, std::span<char> out);

  // True once the whole body has been consumed.
  [[nodiscard]] bool atEnd() const noexcept { return _ended; }

  // True if reading was aborted by a fatal error.
  [[nodiscard]] bool failed() const noexcept { return _failure.has_value(); }

  // True if this reader knows where the body ends, so that unread bytes can be drained.
  [[nodiscard]] bool bounded() const noexcept { return !std::holds_alternative<PassThroughState>(_state); }

  // Remaining body bytes of a fixed-length body, std::nullopt for other framings.
  [[nodiscard]] std::optional<std::size_t> remaining() const noexcept;

  // Total number of body bytes produced so far.
  [[nodiscard]] std::size_t bytesRead() const noexcept { return _bytesRead; }

  [[nodiscard]] std::string_view framingName() const noexcept;

 private:
  struct EmptyState {};

  struct FixedLengthState {
    std::size_t remaining;
  };

  struct ChunkedState {
    enum class Phase : std::uint8_t { SizeLine, Payload, PayloadCRLF, Trailers };

    Phase phase{Phase::SizeLine};
    std::size_t chunkRemaining{};
  };

  struct PassThroughState {};

  BodyReadResult readFixedLength(FixedLengthState& state, BufferedSource& source, std::span<char> out);
  BodyReadResult readChunked(ChunkedState& state, BufferedSource& source, std::span<char> out);
  BodyReadResult readPassThrough(BufferedSource& source, std::span<char> out);

  BodyReadResult end(std::size_t nbBytes);
  BodyReadResult fail(std::size_t nbBytes, BodyReadStatus status);

  std::variant<EmptyState, FixedLengthState, ChunkedState, PassThroughState> _state;
  CompletionCallback _onEnd;
  std::size_t _maxLineBytes{0};
  std::size_t _bytesRead{0};
  std::optional<BodyReadStatus> _failure;
  bool _ended{true};
};

}  // namespace framelink::http
