#include "framelink/test-client.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <thread>

#include "framelink/base-fd.hpp"
#include "framelink/errno-throw.hpp"
#include "framelink/log.hpp"

namespace framelink::test {

namespace {

constexpr std::size_t kRecvChunkSize = 4096;

bool ConnectLoop(int fd, uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  for (const auto deadline = std::chrono::steady_clock::now() + timeout; std::chrono::steady_clock::now() < deadline;
       std::this_thread::sleep_for(std::chrono::milliseconds{1})) {
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
      return true;
    }
    log::debug("connect failed for fd # {}: {}", fd, std::strerror(errno));
  }
  return false;
}

// Appends one received chunk to 'out'. Returns false on close, error or timeout.
bool RecvChunk(int fd, std::string& out) {
  char buf[kRecvChunkSize];
  while (true) {
    const auto nbBytes = ::recv(fd, buf, sizeof(buf), 0);
    if (nbBytes > 0) {
      out.append(buf, static_cast<std::size_t>(nbBytes));
      return true;
    }
    if (nbBytes == -1 && errno == EINTR) {
      continue;
    }
    return false;
  }
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _baseFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create client socket");
  }
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  if (::setsockopt(_baseFd.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    throw_errno("setsockopt(SO_RCVTIMEO) failed");
  }
  _connected = ConnectLoop(_baseFd.fd(), port, timeout);
}

bool sendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent == -1 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      log::error("sendAll failed with error {}", std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

std::string recvAtLeast(int fd, std::size_t nbBytes) {
  std::string out;
  while (out.size() < nbBytes && RecvChunk(fd, out)) {
  }
  return out;
}

std::string recvUntilClosed(int fd) {
  std::string out;
  while (RecvChunk(fd, out)) {
  }
  return out;
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  ClientConnection clientConnection(port);
  if (!clientConnection.connected() || !sendAll(clientConnection.fd(), raw)) {
    return {};
  }
  return recvUntilClosed(clientConnection.fd());
}

int countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  for (auto pos = haystack.find(needle); pos != std::string_view::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace framelink::test
