#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "framelink/body-reader.hpp"
#include "framelink/buffered-source.hpp"

namespace framelink::http {

enum class DrainStatus : std::uint8_t {
  Completed,  // end of body reached, request terminated
  Pending,    // waiting for more bytes from the peer, call resume() when the connection is readable
  Failed      // I/O error or invalid framing, connection must not be reused
};

std::string_view DrainStatusName(DrainStatus status) noexcept;

// Discards the request body bytes left unread by a handler, so that the connection reaches the start of
// the next request. Reads go through the request BodyReader, which bounds the drain (remaining count for a
// fixed-length body, terminating chunk for a chunked one) and fires the 'request terminated' signal when
// its end of body is reached, never before.
// The scratch buffer is reused across requests of a connection.
class DrainCoordinator {
 public:
  explicit DrainCoordinator(std::size_t scratchBytes);

  // Start draining. Completes synchronously if the body has already been consumed.
  // The reader must stay alive until the drain is no longer active.
  DrainStatus begin(BodyReader& reader, BufferedSource& source);

  // Continue a pending drain once new bytes may be available.
  DrainStatus resume(BufferedSource& source);

  // Abandon the current drain, if any.
  void cancel() noexcept { _pReader = nullptr; }

  [[nodiscard]] bool active() const noexcept { return _pReader != nullptr; }

  // Number of bytes discarded by the current (or last) drain.
  [[nodiscard]] std::size_t drainedBytes() const noexcept { return _drainedBytes; }

 private:
  DrainStatus run(BufferedSource& source);

  std::vector<char> _scratch;
  BodyReader* _pReader{nullptr};
  std::size_t _drainedBytes{0};
};

}  // namespace framelink::http
