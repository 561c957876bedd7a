#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "ignyx/call-bridge.hpp"
#include "ignyx/call-lock.hpp"
#include "ignyx/dependency.hpp"
#include "ignyx/dispatcher-config.hpp"
#include "ignyx/exception-handlers.hpp"
#include "ignyx/handler-descriptor.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/request-context.hpp"
#include "ignyx/router.hpp"
#include "ignyx/signature.hpp"
#include "ignyx/timer-queue.hpp"
#include "ignyx/vector.hpp"
#include "ignyx/worker-pool.hpp"

namespace ignyx {

// Receives the response of a dispatched request. Called exactly once per dispatch, from a worker thread.
using ResponseCallback = std::function<void(HttpResponse)>;

// Request processing engine: routing, middleware onion, parameter and dependency resolution, handler execution
// under the call-lock, response marshaling and error conversion.
// Registration happens on a single thread before freeze(); afterwards the dispatcher is immutable (except for
// dependency overrides) and dispatch() may be called from any thread.
class Dispatcher {
 public:
  using HttpRouter = Router<HandlerDescriptorPtr>;

  explicit Dispatcher(DispatcherConfig config = {});

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  ~Dispatcher();

  // Throws RouteConflict, std::invalid_argument for an invalid template or signature, std::logic_error once frozen.
  void addRoute(http::Method method, std::string_view pattern, const Signature& signature, Handler handler,
                std::string name = {});

  void addMiddleware(MiddlewareEntry entry);

  // Mutable before freeze(), overrides may be changed at any time.
  [[nodiscard]] DependencyRegistry& dependencies() noexcept { return _dependencies; }

  [[nodiscard]] ExceptionHandlers& exceptionHandlers();

  // Checks every dependency referenced by a route, then forbids further registration.
  void freeze();

  [[nodiscard]] bool frozen() const noexcept { return _frozen; }

  // Queues the processing of the request held by 'context'. 'onResponse' is invoked once with the response.
  void dispatch(std::shared_ptr<RequestContext> context, ResponseCallback onResponse);

  // Queues the end of a request, to be called once its response has been written ('sent') or dropped:
  // runs the background tasks (if sent) then the teardowns, under the call-lock.
  void finalize(std::shared_ptr<RequestContext> context, bool sent);

  // Same as finalize() but on the calling thread.
  void finalizeNow(RequestContext& context, bool sent);

  // Dispatches 'request', waits for the response and finalizes it. For embedding and tests.
  HttpResponse dispatchBlocking(HttpRequest request);

  // Runs 'job' on a worker thread. Returns false if the dispatcher is stopped.
  bool post(std::function<void()> job) { return _workers.post(std::move(job)); }

  // Wraps a streaming body source so that each pull runs under the call-lock.
  [[nodiscard]] HttpResponse::ChunkSource guardChunkSource(HttpResponse::ChunkSource source);

  // Stops timers and thread pools, running queued work first. Idempotent.
  void stop();

  [[nodiscard]] CallBridge& bridge() noexcept { return _bridge; }

  [[nodiscard]] CallLock& callLock() noexcept { return _callLock; }

  [[nodiscard]] const HttpRouter& router() const noexcept { return _router; }

  [[nodiscard]] const MiddlewareChain& middlewares() const noexcept { return _middlewares; }

  [[nodiscard]] const DispatcherConfig& config() const noexcept { return _config; }

 private:
  struct Exchange;

  void process(const std::shared_ptr<Exchange>& exchange);
  void invokeHandler(const std::shared_ptr<Exchange>& exchange);
  void completeWithLock(const std::shared_ptr<Exchange>& exchange, HttpResponse response);
  void failWithLock(const std::shared_ptr<Exchange>& exchange, std::exception_ptr error);
  void complete(Exchange& exchange, HttpResponse response);
  void fail(Exchange& exchange, std::exception_ptr error);
  void completeResult(Exchange& exchange, HandlerResult result);
  void deliverUnhooked(Exchange& exchange, const std::exception& error);
  static void Deliver(Exchange& exchange, HttpResponse response);

  void checkNotFrozen(std::string_view what) const;

  DispatcherConfig _config;
  HttpRouter _router;
  vector<HandlerDescriptorPtr> _descriptors;
  MiddlewareChain _middlewares;
  DependencyRegistry _dependencies;
  ExceptionHandlers _exceptionHandlers;
  CallLock _callLock;
  WorkerPool _workers;
  WorkerPool _offloadPool;
  TimerQueue _timers;
  CallBridge _bridge;
  bool _frozen{false};
};

}  // namespace ignyx
