#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "ignyx/base-fd.hpp"

namespace ignyx {

// Accepts one pending connection as a non-blocking, close-on-exec socket.
// Returns a closed BaseFd when no connection is pending (EAGAIN) or on error (logged).
[[nodiscard]] BaseFd AcceptNonBlocking(int listenFd) noexcept;

// Disables Nagle's algorithm. Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// send() with MSG_NOSIGNAL. Returns the number of bytes sent, or -1 with errno set.
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// recv() retrying on EINTR. Returns the number of bytes read, 0 on orderly shutdown, -1 with errno set.
int64_t SafeRecv(int fd, void* buf, std::size_t len) noexcept;

bool ShutdownWrite(int fd) noexcept;

}  // namespace ignyx
