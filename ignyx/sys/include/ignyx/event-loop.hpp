#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "ignyx/base-fd.hpp"
#include "ignyx/event.hpp"
#include "ignyx/timedef.hpp"

namespace ignyx {

// Thin RAII wrapper over epoll.
// The ready-event buffer doubles whenever a poll saturates it, and never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct Event {
    int fd;
    EventBmp eventBmp;
  };

  explicit EventLoop(SteadyDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Throws std::system_error on failure.
  void addOrThrow(int fd, EventBmp events) const;

  // Returns false on failure (logged).
  [[nodiscard]] bool add(int fd, EventBmp events) const;

  [[nodiscard]] bool mod(int fd, EventBmp events) const;

  void del(int fd) const;

  // Waits up to the poll timeout. The returned span stays valid until the next call.
  // An interrupted or timed out poll yields an empty span.
  [[nodiscard]] std::span<const Event> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_readyEvents.size()); }

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  std::vector<Event> _readyEvents;
  std::vector<unsigned char> _rawEvents;
};

}  // namespace ignyx
