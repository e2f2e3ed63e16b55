#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "framelink/transport.hpp"

namespace framelink {

// Raw outbound byte sink of a connection. Data is queued in order and written to the transport on flush(),
// which may stop early when the transport would block.
class BufferedSink {
 public:
  enum class FlushStatus : std::uint8_t { Done, WouldBlock, Error };

  explicit BufferedSink(ITransport& transport) : _pTransport(&transport) {}

  void append(std::string_view data) { _pending.append(data); }

  // Write as much queued data as possible.
  FlushStatus flush();

  [[nodiscard]] bool empty() const noexcept { return _pending.size() == _writePos; }
  [[nodiscard]] std::size_t pendingBytes() const noexcept { return _pending.size() - _writePos; }

  // True once the transport reported a fatal error. Further flushes fail immediately.
  [[nodiscard]] bool failed() const noexcept { return _failed; }

  // Total number of bytes effectively written to the transport since construction.
  [[nodiscard]] uint64_t totalBytesWritten() const noexcept { return _totalBytesWritten; }

 private:
  ITransport* _pTransport;
  std::string _pending;
  std::size_t _writePos{0};
  uint64_t _totalBytesWritten{0};
  bool _failed{false};
};

}  // namespace framelink
