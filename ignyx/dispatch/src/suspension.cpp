#include "ignyx/suspension.hpp"

#include <functional>
#include <stdexcept>
#include <utility>

#include "ignyx/timedef.hpp"
#include "ignyx/timer-queue.hpp"
#include "ignyx/worker-pool.hpp"

namespace ignyx {

namespace {

thread_local SuspensionContext* gCurrentContext = nullptr;

}  // namespace

SuspensionContext& SuspensionContext::Current() {
  if (gCurrentContext == nullptr) {
    throw std::logic_error("Engine awaitables can only be awaited from a handler task driven by the engine");
  }
  return *gCurrentContext;
}

SuspensionContext* SuspensionContext::CurrentOrNull() noexcept { return gCurrentContext; }

SuspensionContext::Scope::Scope(SuspensionContext& context) noexcept
    : _previous(std::exchange(gCurrentContext, &context)) {}

SuspensionContext::Scope::~Scope() { gCurrentContext = _previous; }

namespace internal {

void PostOffload(SuspensionContext& context, std::function<void()> job) {
  if (!context.offloadPool().post(std::move(job))) {
    throw std::runtime_error("Offload pool is stopped");
  }
}

void ScheduleTimer(SuspensionContext& context, SteadyTimePoint deadline, std::function<void()> callback) {
  context.timers().schedule(deadline, std::move(callback));
}

}  // namespace internal

}  // namespace ignyx
