#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "framelink/base-fd.hpp"

namespace framelink::test {
using namespace std::chrono_literals;

// Blocking loopback TCP client. Receive operations time out after 'timeout' without data.
class ClientConnection {
 public:
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 2000ms);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  [[nodiscard]] bool connected() const noexcept { return _connected; }

 private:
  BaseFd _baseFd;
  bool _connected{false};
};

bool sendAll(int fd, std::string_view data);

// Reads until at least 'nbBytes' have been received, the peer closes or the receive timeout expires.
std::string recvAtLeast(int fd, std::size_t nbBytes);

// Reads until the peer closes the connection (or the receive timeout expires).
std::string recvUntilClosed(int fd);

std::string sendAndCollect(uint16_t port, std::string_view raw);

int countOccurrences(std::string_view haystack, std::string_view needle);

}  // namespace framelink::test
