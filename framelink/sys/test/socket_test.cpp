#include "framelink/socket.hpp"

#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <system_error>

#include "framelink/base-fd.hpp"

namespace framelink {

TEST(Socket, Nominal) {
  Socket sock = Socket::CreateNonBlocking();
  EXPECT_TRUE(sock);
  EXPECT_GE(sock.fd(), 0);
  sock.close();
  EXPECT_FALSE(sock);
}

TEST(Socket, BindAndListenUpdatesPort) {
  Socket sock = Socket::CreateNonBlocking();
  uint16_t port = 0;
  EXPECT_NO_THROW(sock.bindAndListen(false, port));
  EXPECT_NE(0, port);
}

TEST(Socket, BindAndListenThrowsWhenPortInUse) {
  Socket first = Socket::CreateNonBlocking();
  uint16_t port = 0;
  first.bindAndListen(false, port);
  Socket second = Socket::CreateNonBlocking();
  EXPECT_THROW(second.bindAndListen(false, port), std::system_error);
}

TEST(Socket, AcceptNonBlocking) {
  Socket listener = Socket::CreateNonBlocking();
  uint16_t port = 0;
  listener.bindAndListen(false, port);
  EXPECT_FALSE(listener.acceptNonBlocking());

  BaseFd client(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  ASSERT_TRUE(client);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ASSERT_EQ(::connect(client.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)), 0);

  BaseFd accepted = listener.acceptNonBlocking();
  EXPECT_TRUE(accepted);
  EXPECT_FALSE(listener.acceptNonBlocking());
}

}  // namespace framelink
