#include "ignyx/call-lock.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

#include "ignyx/log.hpp"
#include "ignyx/timedef.hpp"

namespace ignyx {

bool CallLock::tryAcquireLocked(std::thread::id self) {
  if (_depth != 0 && _owner == self) {
    ++_depth;
    return true;
  }
  if (_depth == 0 && _waiters.empty()) {
    _owner = self;
    _depth = 1;
    ++_stats.acquisitions;
    return true;
  }
  return false;
}

void CallLock::lock() {
  const auto self = std::this_thread::get_id();
  std::unique_lock lock(_mutex);
  if (tryAcquireLocked(self)) {
    return;
  }
  ++_stats.contended;
  Waiter waiter;
  waiter.thread = self;
  _waiters.push_back(&waiter);
  waiter.cv.wait(lock, [&waiter] { return waiter.granted; });
  ++_stats.acquisitions;
}

bool CallLock::tryLockUntil(SteadyTimePoint deadline) {
  const auto self = std::this_thread::get_id();
  std::unique_lock lock(_mutex);
  if (tryAcquireLocked(self)) {
    return true;
  }
  ++_stats.contended;
  Waiter waiter;
  waiter.thread = self;
  _waiters.push_back(&waiter);
  if (waiter.cv.wait_until(lock, deadline, [&waiter] { return waiter.granted; })) {
    ++_stats.acquisitions;
    return true;
  }
  // Not granted: still queued, leave the queue.
  _waiters.erase(std::ranges::find(_waiters, &waiter));
  ++_stats.timeouts;
  return false;
}

void CallLock::unlock() noexcept {
  std::scoped_lock lock(_mutex);
  if (_depth == 0 || _owner != std::this_thread::get_id()) {
    log::error("CallLock released by a thread that does not own it");
    return;
  }
  if (--_depth != 0) {
    return;
  }
  if (_waiters.empty()) {
    _owner = {};
    return;
  }
  Waiter* next = _waiters.front();
  _waiters.pop_front();
  _owner = next->thread;
  _depth = 1;
  next->granted = true;
  next->cv.notify_one();
}

bool CallLock::heldByCurrentThread() const {
  std::scoped_lock lock(_mutex);
  return _depth != 0 && _owner == std::this_thread::get_id();
}

std::size_t CallLock::nbWaiters() const {
  std::scoped_lock lock(_mutex);
  return _waiters.size();
}

CallLock::Stats CallLock::stats() const {
  std::scoped_lock lock(_mutex);
  return _stats;
}

}  // namespace ignyx
