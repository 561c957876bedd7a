#pragma once

#include <any>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "ignyx/background-tasks.hpp"
#include "ignyx/dependency.hpp"
#include "ignyx/flat-hash-map.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

class CallLock;

// Per-request state shared between the connection that received the request and the dispatcher executing it:
// the request itself, the dependency cache, teardown callbacks, background tasks and the cancellation flag.
class RequestContext {
 public:
  explicit RequestContext(HttpRequest request) : _request(std::move(request)) {}

  RequestContext(const RequestContext&) = delete;
  RequestContext& operator=(const RequestContext&) = delete;

  // Runs teardowns that were not run yet (under the bound lock, if any).
  ~RequestContext();

  [[nodiscard]] HttpRequest& request() noexcept { return _request; }
  [[nodiscard]] const HttpRequest& request() const noexcept { return _request; }

  [[nodiscard]] BackgroundTasks& backgroundTasks() noexcept { return _backgroundTasks; }

  // The client went away: pending suspended work is abandoned at its next resumption.
  void cancel() noexcept { _cancelled.store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool isCancelled() const noexcept { return _cancelled.load(std::memory_order_relaxed); }

  // Resolves dependency 'name' and its sub-dependencies, invoking each provider at most once for this request
  // (unless its policy is AlwaysRecompute). Must be called with the call-lock held.
  std::any& resolveDependency(const DependencyRegistry& registry, std::string_view name);

  // Value of an already resolved dependency, or nullptr.
  [[nodiscard]] std::any* cachedDependency(std::string_view name) noexcept;

  void addTeardown(std::function<void()> fn) { _teardowns.push_back(std::move(fn)); }

  [[nodiscard]] bool hasPendingTeardowns() const noexcept { return !_teardowns.empty(); }

  // Runs the registered teardowns in reverse registration order. Each teardown runs once, failures are logged.
  void runTeardowns() noexcept;

  // Lock to acquire if teardowns still need to run at destruction.
  void bindCallLock(CallLock& callLock) noexcept { _callLock = &callLock; }

 private:
  std::any& resolve(const DependencyRegistry& registry, const DependencyNode& node, uint32_t depth);

  HttpRequest _request;
  BackgroundTasks _backgroundTasks;
  std::atomic<bool> _cancelled{false};
  flat_hash_map<std::string, std::unique_ptr<std::any>> _dependencyCache;
  // Values computed with AlwaysRecompute stay alive until the end of the request.
  vector<std::unique_ptr<std::any>> _recomputedValues;
  vector<std::function<void()>> _teardowns;
  CallLock* _callLock{nullptr};
};

}  // namespace ignyx
