#include "ignyx/timer-queue.hpp"

#include <exception>
#include <mutex>
#include <utility>

#include "ignyx/log.hpp"
#include "ignyx/timedef.hpp"

namespace ignyx {

namespace {

void Fire(const TimerQueue::Callback& callback) {
  try {
    callback();
  } catch (const std::exception& ex) {
    log::error("Uncaught exception in timer callback: {}", ex.what());
  }
}

}  // namespace

TimerQueue::TimerQueue() : _thread([this] { loop(); }) {}

TimerQueue::~TimerQueue() { stop(); }

void TimerQueue::schedule(SteadyTimePoint deadline, Callback callback) {
  {
    std::scoped_lock lock(_mutex);
    if (!_stopping) {
      _entries.push(Entry{deadline, _nextSeq++, std::move(callback)});
      _cv.notify_one();
      return;
    }
  }
  Fire(callback);
}

void TimerQueue::stop() {
  {
    std::scoped_lock lock(_mutex);
    if (_stopping) {
      return;
    }
    _stopping = true;
  }
  _cv.notify_one();
  if (_thread.joinable()) {
    _thread.join();
  }
}

std::size_t TimerQueue::nbPending() const {
  std::scoped_lock lock(_mutex);
  return _entries.size();
}

void TimerQueue::loop() {
  std::unique_lock lock(_mutex);
  while (true) {
    if (_stopping) {
      while (!_entries.empty()) {
        Callback callback = std::move(const_cast<Entry&>(_entries.top()).callback);
        _entries.pop();
        lock.unlock();
        Fire(callback);
        lock.lock();
      }
      return;
    }
    if (_entries.empty()) {
      _cv.wait(lock);
      continue;
    }
    const SteadyTimePoint deadline = _entries.top().deadline;
    if (SteadyClock::now() < deadline) {
      _cv.wait_until(lock, deadline);
      continue;
    }
    Callback callback = std::move(const_cast<Entry&>(_entries.top()).callback);
    _entries.pop();
    lock.unlock();
    Fire(callback);
    lock.lock();
  }
}

}  // namespace ignyx
