#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace ignyx {

// Fixed set of threads consuming a FIFO job queue.
class WorkerPool {
 public:
  using Job = std::function<void()>;

  WorkerPool(uint32_t nbThreads, std::string_view name);

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  ~WorkerPool();

  // Queues 'job'. Returns false (job dropped) if the pool is stopped.
  bool post(Job job);

  // Runs the queued jobs, then joins the threads. Idempotent.
  void stop();

  [[nodiscard]] uint32_t nbThreads() const noexcept { return static_cast<uint32_t>(_threads.size()); }

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

 private:
  void loop();

  std::string _name;
  std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<Job> _jobs;
  bool _stopping{false};
  std::vector<std::jthread> _threads;
};

}  // namespace ignyx
