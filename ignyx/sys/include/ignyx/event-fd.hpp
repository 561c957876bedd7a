#pragma once

#include "ignyx/base-fd.hpp"

namespace ignyx {

// Non-blocking eventfd used to wake up a reactor from another thread.
class EventFd {
 public:
  EventFd();

  void send() const noexcept;

  // Drains pending wakeups.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace ignyx
