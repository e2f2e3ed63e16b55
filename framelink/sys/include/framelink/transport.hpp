#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace framelink {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation.
enum class TransportHint : uint8_t {
  None,        // No special action needed (operation completed, or orderly close on read when 0 bytes)
  ReadReady,   // Need socket readable before operation can proceed
  WriteReady,  // Need socket writable before operation can proceed
  Error        // Fatal I/O error, connection must be dropped
};

// Raw byte-stream abstraction of a connection. Framing wrappers never talk to sockets directly.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    TransportHint want;
  };

  // Non-blocking read.
  //  - bytesProcessed > 0: data read
  //  - bytesProcessed == 0 && want == None: orderly close by peer
  //  - bytesProcessed == 0 && want == ReadReady: would block
  //  - want == Error: fatal error
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write. Returns the number of bytes written. If less than data.size(), check 'want'.
  virtual TransportResult write(std::string_view data) = 0;
};

// Plain transport directly operates on a non-blocking fd (not owned).
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace framelink
