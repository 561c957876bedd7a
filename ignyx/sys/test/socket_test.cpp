#include "ignyx/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>
#include <utility>

#include "ignyx/base-fd.hpp"
#include "ignyx/socket-ops.hpp"

namespace ignyx {

using namespace std::chrono_literals;

namespace {

void ConnectLoopback(const Socket& client, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ASSERT_EQ(::connect(client.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)), 0);
}

BaseFd AcceptWithRetry(int listenFd) {
  for (int attempt = 0; attempt < 100; ++attempt) {
    BaseFd fd = AcceptNonBlocking(listenFd);
    if (fd) {
      return fd;
    }
    std::this_thread::sleep_for(1ms);
  }
  return BaseFd{};
}

}  // namespace

TEST(Socket, EphemeralPortIsWrittenBack) {
  Socket listener(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  listener.bindAndListen(false, port, 16);
  EXPECT_NE(port, 0);
}

TEST(Socket, ReusePortAllowsTwoListeners) {
  Socket first(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  first.bindAndListen(true, port, 16);
  Socket second(Socket::Type::StreamNonBlock);
  uint16_t samePort = port;
  second.bindAndListen(true, samePort, 16);
  EXPECT_EQ(samePort, port);
}

TEST(Socket, AcceptWithoutPendingConnectionReturnsClosedFd) {
  Socket listener(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  listener.bindAndListen(false, port, 16);
  EXPECT_FALSE(AcceptNonBlocking(listener.fd()));
}

TEST(Socket, SendAndReceiveOverLoopback) {
  Socket listener(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  listener.bindAndListen(false, port, 16);

  Socket client(Socket::Type::Stream);
  ConnectLoopback(client, port);
  Socket server(AcceptWithRetry(listener.fd()));
  ASSERT_TRUE(server);
  EXPECT_TRUE(SetTcpNoDelay(server.fd()));

  constexpr std::string_view kMessage = "ping";
  ASSERT_EQ(SafeSend(client.fd(), kMessage), static_cast<int64_t>(kMessage.size()));

  char buf[16];
  int64_t nbRead = -1;
  for (int attempt = 0; attempt < 100 && nbRead < 0; ++attempt) {
    nbRead = SafeRecv(server.fd(), buf, sizeof(buf));
    if (nbRead < 0) {
      ASSERT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
      std::this_thread::sleep_for(1ms);
    }
  }
  ASSERT_EQ(nbRead, static_cast<int64_t>(kMessage.size()));
  EXPECT_EQ(std::string_view(buf, 4), kMessage);

  EXPECT_TRUE(ShutdownWrite(client.fd()));
  for (int attempt = 0; attempt < 100; ++attempt) {
    nbRead = SafeRecv(server.fd(), buf, sizeof(buf));
    if (nbRead >= 0) {
      break;
    }
    std::this_thread::sleep_for(1ms);
  }
  EXPECT_EQ(nbRead, 0);
}

TEST(BaseFd, ReleaseAndMove) {
  Socket sock(Socket::Type::Stream);
  BaseFd fd(::dup(sock.fd()));
  ASSERT_TRUE(fd);
  BaseFd moved(std::move(fd));
  EXPECT_FALSE(fd);
  ASSERT_TRUE(moved);
  moved.close();
  EXPECT_FALSE(moved);
}

}  // namespace ignyx
