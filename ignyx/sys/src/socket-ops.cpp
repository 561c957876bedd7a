#include "ignyx/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "ignyx/base-fd.hpp"
#include "ignyx/log.hpp"

namespace ignyx {

BaseFd AcceptNonBlocking(int listenFd) noexcept {
  while (true) {
    const int fd = ::accept4(listenFd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd != -1) {
      return BaseFd(fd);
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err != EAGAIN && err != EWOULDBLOCK) {
      log::error("accept4 failed on fd # {}: {}", listenFd, std::strerror(err));
    }
    return BaseFd{};
  }
}

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  while (true) {
    const auto ret = ::send(fd, data, len, MSG_NOSIGNAL);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(ret);
  }
}

int64_t SafeRecv(int fd, void* buf, std::size_t len) noexcept {
  while (true) {
    const auto ret = ::recv(fd, buf, len, 0);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(ret);
  }
}

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace ignyx
