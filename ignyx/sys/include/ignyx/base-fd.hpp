#pragma once

namespace ignyx {

// RAII owner of a POSIX file descriptor.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership without closing.
  [[nodiscard]] int release() noexcept;

  // Idempotent early close.
  void close() noexcept;

 private:
  int _fd;
};

}  // namespace ignyx
