#pragma once

#include <cstdint>

#include "framelink/base-fd.hpp"

namespace framelink {

// RAII non-blocking IPv4 TCP listening socket.
class Socket {
 public:
  Socket() noexcept = default;

  // Create a non-blocking stream socket.
  // Throws std::system_error on failure.
  static Socket CreateNonBlocking();

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind and start listening on the given port. If port is 0, an ephemeral port is chosen and written back.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, uint16_t& port);

  // Accept a pending connection as a non-blocking fd.
  // Returns an invalid BaseFd when no connection is pending (or on non fatal accept errors, logged).
  [[nodiscard]] BaseFd acceptNonBlocking() const;

  void close() noexcept { _baseFd.close(); }

 private:
  explicit Socket(int fd) noexcept : _baseFd(fd) {}

  BaseFd _baseFd;
};

}  // namespace framelink
