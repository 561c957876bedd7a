#include "ignyx/background-tasks.hpp"

#include <cstddef>
#include <exception>
#include <typeinfo>
#include <utility>

#include "ignyx/demangle.hpp"
#include "ignyx/log.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

std::size_t BackgroundTasks::runAll() noexcept {
  vector<Task> tasks = std::move(_tasks);
  _tasks.clear();
  std::size_t nbFailed = 0;
  for (std::size_t taskPos = 0; taskPos < tasks.size(); ++taskPos) {
    try {
      tasks[taskPos]();
    } catch (const std::exception& ex) {
      ++nbFailed;
      log::error("Background task #{} failed with {}: {}", taskPos, DemangledName(typeid(ex)), ex.what());
    } catch (...) {
      ++nbFailed;
      log::error("Background task #{} failed with a non standard exception", taskPos);
    }
  }
  return nbFailed;
}

}  // namespace ignyx
