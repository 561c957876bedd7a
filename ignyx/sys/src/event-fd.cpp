#include "ignyx/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "ignyx/errno-throw.hpp"
#include "ignyx/log.hpp"

namespace ignyx {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new EventFd");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  static constexpr eventfd_t kOne = 1;
  if (::eventfd_write(fd(), kOne) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("EventFd send failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

void EventFd::read() const noexcept {
  eventfd_t counterValue;
  if (::eventfd_read(fd(), &counterValue) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("EventFd read failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

}  // namespace ignyx
