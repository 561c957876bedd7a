#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

#include "ignyx/timedef.hpp"

namespace ignyx {

// Process-wide exclusive lock guarding every execution of user code.
// Waiters are served in strict arrival order: unlock() hands ownership directly to the oldest waiter, so a thread
// arriving later can never overtake it. The owning thread may re-acquire the lock (depth counted).
// A waiter giving up on its deadline leaves the queue without disturbing the others.
class CallLock {
 public:
  struct Stats {
    uint64_t acquisitions{0};
    uint64_t contended{0};
    uint64_t timeouts{0};
  };

  // Releases an acquired lock at scope exit.
  class Guard {
   public:
    Guard() noexcept = default;

    // Adopts a lock already acquired by the calling thread.
    explicit Guard(CallLock& lock) noexcept : _lock(&lock) {}

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    Guard(Guard&& other) noexcept : _lock(std::exchange(other._lock, nullptr)) {}
    Guard& operator=(Guard&& other) noexcept {
      if (this != &other) {
        unlock();
        _lock = std::exchange(other._lock, nullptr);
      }
      return *this;
    }

    ~Guard() { unlock(); }

    void unlock() noexcept {
      if (_lock != nullptr) {
        std::exchange(_lock, nullptr)->unlock();
      }
    }

    // Gives up ownership without unlocking. The caller becomes responsible for unlock().
    void release() noexcept { _lock = nullptr; }

    [[nodiscard]] bool ownsLock() const noexcept { return _lock != nullptr; }

   private:
    CallLock* _lock{nullptr};
  };

  CallLock() = default;

  CallLock(const CallLock&) = delete;
  CallLock& operator=(const CallLock&) = delete;

  void lock();

  // Returns false if the lock could not be obtained before 'deadline'.
  [[nodiscard]] bool tryLockUntil(SteadyTimePoint deadline);

  [[nodiscard]] bool tryLockFor(SteadyDuration timeout) { return tryLockUntil(SteadyClock::now() + timeout); }

  void unlock() noexcept;

  [[nodiscard]] bool heldByCurrentThread() const;

  [[nodiscard]] std::size_t nbWaiters() const;

  [[nodiscard]] Stats stats() const;

 private:
  struct Waiter {
    std::condition_variable cv;
    std::thread::id thread;
    bool granted{false};
  };

  // Returns true if the lock was taken immediately (free, or reentrant acquisition). _mutex must be held.
  bool tryAcquireLocked(std::thread::id self);

  mutable std::mutex _mutex;
  std::deque<Waiter*> _waiters;
  std::thread::id _owner;
  uint32_t _depth{0};
  Stats _stats;
};

}  // namespace ignyx
