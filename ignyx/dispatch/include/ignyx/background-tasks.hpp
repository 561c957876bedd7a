#pragma once

#include <cstddef>
#include <functional>

#include "ignyx/vector.hpp"

namespace ignyx {

// Work scheduled by a handler to run once its response has been fully written.
// Tasks run in insertion order under the call-lock. They are dropped if the response could not be delivered.
class BackgroundTasks {
 public:
  using Task = std::function<void()>;

  void add(Task task) { _tasks.push_back(std::move(task)); }

  [[nodiscard]] std::size_t size() const noexcept { return _tasks.size(); }

  [[nodiscard]] bool empty() const noexcept { return _tasks.empty(); }

  // Runs and clears all tasks. A failing task is logged and does not prevent the next ones.
  // Returns the number of failed tasks.
  std::size_t runAll() noexcept;

  void clear() noexcept { _tasks.clear(); }

 private:
  vector<Task> _tasks;
};

}  // namespace ignyx
