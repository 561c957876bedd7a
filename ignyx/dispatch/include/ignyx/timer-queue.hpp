#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "ignyx/timedef.hpp"

namespace ignyx {

// Single thread firing callbacks at their deadline. Callbacks must be short: they typically post work elsewhere.
class TimerQueue {
 public:
  using Callback = std::function<void()>;

  TimerQueue();

  TimerQueue(const TimerQueue&) = delete;
  TimerQueue& operator=(const TimerQueue&) = delete;

  ~TimerQueue();

  void schedule(SteadyTimePoint deadline, Callback callback);

  // Fires all pending callbacks immediately, then joins the thread. Later schedules fire immediately.
  void stop();

  [[nodiscard]] std::size_t nbPending() const;

 private:
  struct Entry {
    SteadyTimePoint deadline;
    uint64_t seq;
    Callback callback;

    bool operator>(const Entry& other) const noexcept {
      return deadline != other.deadline ? deadline > other.deadline : seq > other.seq;
    }
  };

  void loop();

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<>> _entries;
  uint64_t _nextSeq{0};
  bool _stopping{false};
  std::jthread _thread;
};

}  // namespace ignyx
