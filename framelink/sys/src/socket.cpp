#include "framelink/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "framelink/base-fd.hpp"
#include "framelink/errno-throw.hpp"
#include "framelink/log.hpp"

namespace framelink {

Socket Socket::CreateNonBlocking() {
  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd == -1) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", fd);
  return Socket(fd);
}

void Socket::bindAndListen(bool reusePort, uint16_t& port) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd(), SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) != 0) {
    log::warn("setsockopt(SO_REUSEPORT) failed: {}", std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed");
  }
  if (::listen(fd(), SOMAXCONN) != 0) {
    throw_errno("listen failed");
  }
  if (port == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      throw_errno("getsockname failed");
    }
    port = ntohs(addr.sin_port);
  }
  log::info("Listening on port {} (fd # {})", port, fd());
}

BaseFd Socket::acceptNonBlocking() const {
  while (true) {
    const int cnxFd = ::accept4(fd(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (cnxFd != -1) {
      return BaseFd(cnxFd);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN) {
      log::error("accept failed on fd # {}: {}", fd(), std::strerror(errno));
    }
    return BaseFd();
  }
}

}  // namespace framelink
