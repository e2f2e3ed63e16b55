#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "framelink/transport.hpp"

namespace framelink {

// Raw inbound byte source of a connection, with push-back semantics.
// Bytes read from the transport are accumulated in an internal buffer and only removed when a
// consumer explicitly consumes them, so bytes following the current message (pipelined requests)
// stay available for the next one.
class BufferedSource {
 public:
  enum class FillStatus : std::uint8_t { Data, WouldBlock, Eof, Error };

  // 'readChunkBytes' is the number of bytes requested from the transport on each fill().
  BufferedSource(ITransport& transport, std::size_t readChunkBytes);

  // Unconsumed bytes currently available without touching the transport.
  [[nodiscard]] std::string_view buffered() const noexcept {
    return {_buffer.data() + _readPos, _buffer.size() - _readPos};
  }

  [[nodiscard]] std::size_t size() const noexcept { return _buffer.size() - _readPos; }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  // Remove 'nbBytes' from the front of the buffered bytes. Precondition: nbBytes <= size().
  void consume(std::size_t nbBytes) noexcept;

  // Try to read more bytes from the transport and append them to the buffer.
  FillStatus fill();

  // True once the peer performed an orderly close. Buffered bytes may still be available.
  [[nodiscard]] bool eof() const noexcept { return _eof; }

  // True once the transport reported a fatal error.
  [[nodiscard]] bool failed() const noexcept { return _failed; }

  [[nodiscard]] std::size_t readChunkBytes() const noexcept { return _readChunkBytes; }

  // Total number of bytes received from the transport since construction.
  [[nodiscard]] uint64_t totalBytesRead() const noexcept { return _totalBytesRead; }

 private:
  ITransport* _pTransport;
  std::string _buffer;
  std::size_t _readPos{0};
  std::size_t _readChunkBytes;
  uint64_t _totalBytesRead{0};
  bool _eof{false};
  bool _failed{false};
};

}  // namespace framelink
