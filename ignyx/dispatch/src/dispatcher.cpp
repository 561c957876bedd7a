#include "ignyx/dispatcher.hpp"

#include <exception>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "ignyx/arguments.hpp"
#include "ignyx/call-bridge.hpp"
#include "ignyx/call-lock.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/handler-descriptor.hpp"
#include "ignyx/handler-result.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/log.hpp"
#include "ignyx/marshal.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/request-context.hpp"
#include "ignyx/resolver.hpp"

namespace ignyx {

// State of one request while it travels through the engine.
struct Dispatcher::Exchange {
  Exchange(std::shared_ptr<RequestContext> ctx, ResponseCallback callback)
      : context(std::move(ctx)), onResponse(std::move(callback)) {}

  HttpRequest& request() noexcept { return context->request(); }

  std::shared_ptr<RequestContext> context;
  ResponseCallback onResponse;
  MiddlewareChain::BeforeOutcome before;
  HandlerDescriptorPtr descriptor;
  std::unique_ptr<Arguments> args;
  HandlerTask<HandlerResult> task;
  bool delivered{false};
};

Dispatcher::Dispatcher(DispatcherConfig config)
    : _config((config.validate(), std::move(config))),
      _router(_config.routerConfig),
      _workers(_config.nbWorkerThreads, "workers"),
      _offloadPool(_config.nbOffloadThreads, "offload"),
      _bridge(_callLock, _workers, _offloadPool, _timers, _config.callLockTimeout) {
  _exceptionHandlers.setDebug(_config.debug);
}

Dispatcher::~Dispatcher() { stop(); }

void Dispatcher::checkNotFrozen(std::string_view what) const {
  if (_frozen) {
    throw std::logic_error(std::format("Cannot {} once the application is started", what));
  }
}

void Dispatcher::addRoute(http::Method method, std::string_view pattern, const Signature& signature, Handler handler,
                          std::string name) {
  checkNotFrozen("add a route");
  auto descriptor = std::make_shared<const HandlerDescriptor>(pattern, signature, std::move(handler), std::move(name));
  _router.add(method, pattern, descriptor);
  _descriptors.push_back(std::move(descriptor));
  log::debug("Registered route {} {}", http::MethodToStr(method), pattern);
}

void Dispatcher::addMiddleware(MiddlewareEntry entry) {
  checkNotFrozen("add a middleware");
  _middlewares.add(std::move(entry));
}

ExceptionHandlers& Dispatcher::exceptionHandlers() {
  checkNotFrozen("modify exception handlers");
  return _exceptionHandlers;
}

void Dispatcher::freeze() {
  if (_frozen) {
    return;
  }
  _dependencies.validate();
  for (const HandlerDescriptorPtr& descriptor : _descriptors) {
    descriptor->checkDependencies(_dependencies);
  }
  _frozen = true;
  log::info("Dispatcher ready with {} route(s), {} middleware(s) and {} dependency(ies)", _router.size(),
            _middlewares.size(), _dependencies.size());
}

void Dispatcher::stop() {
  _timers.stop();
  _offloadPool.stop();
  _workers.stop();
}

void Dispatcher::dispatch(std::shared_ptr<RequestContext> context, ResponseCallback onResponse) {
  context->bindCallLock(_callLock);
  auto exchange = std::make_shared<Exchange>(std::move(context), std::move(onResponse));
  if (!_workers.post([this, exchange] { process(exchange); })) {
    Deliver(*exchange, DetailResponse(http::StatusCodeServiceUnavailable, Json(std::string("Server shutting down"))));
  }
}

void Dispatcher::finalize(std::shared_ptr<RequestContext> context, bool sent) {
  auto job = [this, context, sent] { finalizeNow(*context, sent); };
  if (!_workers.post(job)) {
    job();
  }
}

void Dispatcher::finalizeNow(RequestContext& context, bool sent) {
  // Teardowns must run whatever the contention: wait without deadline.
  _callLock.lock();
  CallLock::Guard guard(_callLock);
  if (sent) {
    context.backgroundTasks().runAll();
  } else if (!context.backgroundTasks().empty()) {
    log::debug("Dropping {} background task(s) of an undelivered response", context.backgroundTasks().size());
    context.backgroundTasks().clear();
  }
  context.runTeardowns();
}

HttpResponse Dispatcher::dispatchBlocking(HttpRequest request) {
  auto context = std::make_shared<RequestContext>(std::move(request));
  std::promise<HttpResponse> promise;
  auto future = promise.get_future();
  dispatch(context, [&promise](HttpResponse response) { promise.set_value(std::move(response)); });
  HttpResponse response = future.get();
  finalizeNow(*context, true);
  return response;
}

HttpResponse::ChunkSource Dispatcher::guardChunkSource(HttpResponse::ChunkSource source) {
  return [this, source = std::move(source)]() mutable { return _bridge.call(source); };
}

void Dispatcher::Deliver(Exchange& exchange, HttpResponse response) {
  if (exchange.delivered) {
    return;
  }
  exchange.delivered = true;
  try {
    exchange.onResponse(std::move(response));
  } catch (const std::exception& ex) {
    log::error("Response callback failed: {}", ex.what());
  }
}

void Dispatcher::deliverUnhooked(Exchange& exchange, const std::exception& error) {
  Deliver(exchange, ExceptionHandlers::DefaultResponse(error, _config.debug));
}

void Dispatcher::complete(Exchange& exchange, HttpResponse response) {
  _middlewares.runAfter(exchange.request(), response, exchange.before.nbEntered,
                        [this, &exchange](std::exception_ptr error) {
                          return _exceptionHandlers.handle(exchange.request(), std::move(error));
                        });
  if (response.isStreaming()) {
    const std::string contentType(response.headerValue(http::ContentType).value_or(http::ContentTypeOctetStream));
    response.streamingBody(guardChunkSource(response.takeChunkSource()), contentType);
  }
  Deliver(exchange, std::move(response));
}

void Dispatcher::fail(Exchange& exchange, std::exception_ptr error) {
  std::optional<HttpResponse> response = _middlewares.runOnError(exchange.request(), error, exchange.before.nbEntered);
  if (!response) {
    response.emplace(_exceptionHandlers.handle(exchange.request(), std::move(error)));
  }
  complete(exchange, std::move(*response));
}

void Dispatcher::completeResult(Exchange& exchange, HandlerResult result) {
  HttpResponse response = Marshal(std::move(result), exchange.args->responseHeaders(), exchange.args->cookies());
  complete(exchange, std::move(response));
}

void Dispatcher::completeWithLock(const std::shared_ptr<Exchange>& exchange, HttpResponse response) {
  CallLock::Guard guard;
  try {
    guard = _bridge.acquire();
  } catch (const LockTimeout& ex) {
    deliverUnhooked(*exchange, ex);
    return;
  }
  complete(*exchange, std::move(response));
}

void Dispatcher::failWithLock(const std::shared_ptr<Exchange>& exchange, std::exception_ptr error) {
  CallLock::Guard guard;
  try {
    guard = _bridge.acquire();
  } catch (const LockTimeout& ex) {
    deliverUnhooked(*exchange, ex);
    return;
  }
  fail(*exchange, std::move(error));
}

void Dispatcher::process(const std::shared_ptr<Exchange>& exchange) {
  HttpRequest& request = exchange->request();

  // Before-hooks see the request prior to routing: they may rewrite it or answer requests for unknown paths.
  if (!_middlewares.empty()) {
    CallLock::Guard guard;
    try {
      guard = _bridge.acquire();
    } catch (const LockTimeout& ex) {
      deliverUnhooked(*exchange, ex);
      return;
    }
    try {
      _middlewares.runBefore(request, exchange->before);
    } catch (...) {
      fail(*exchange, CaptureUserException());
      return;
    }
    if (exchange->before.shortCircuit) {
      complete(*exchange, std::move(*exchange->before.shortCircuit));
      return;
    }
  }

  auto match = _router.match(request.method(), request.rawPath());
  switch (match.kind) {
    case HttpRouter::Match::Kind::Matched:
      break;
    case HttpRouter::Match::Kind::MethodNotAllowed:
      if (request.method() == http::Method::OPTIONS) {
        HttpResponse response(http::StatusCodeOK);
        response.header(http::Allow, http::MethodBmpToStr(match.allowedMethods | http::Method::OPTIONS));
        completeWithLock(exchange, std::move(response));
      } else {
        failWithLock(exchange, std::make_exception_ptr(MethodNotAllowed(match.allowedMethods)));
      }
      return;
    case HttpRouter::Match::Kind::Redirect: {
      std::string location = std::move(match.redirectPath);
      if (!request.rawQuery().empty()) {
        location.push_back('?');
        location.append(request.rawQuery());
      }
      completeWithLock(exchange, HttpResponse::Redirect(location));
      return;
    }
    default:
      failWithLock(exchange, std::make_exception_ptr(RouteNotFound()));
      return;
  }

  exchange->descriptor = *match.target;
  request.setPathParams(std::move(match.pathParams));
  exchange->args = std::make_unique<Arguments>(*exchange->context, exchange->descriptor->params());

  // Parameter resolution only reads the request: no need for the call-lock.
  try {
    ResolveParameters(*exchange->descriptor, request, *exchange->args);
  } catch (const ValidationError&) {
    failWithLock(exchange, std::current_exception());
    return;
  }

  invokeHandler(exchange);
}

void Dispatcher::invokeHandler(const std::shared_ptr<Exchange>& exchange) {
  CallLock::Guard guard;
  try {
    guard = _bridge.acquire();
  } catch (const LockTimeout& ex) {
    deliverUnhooked(*exchange, ex);
    return;
  }

  const HandlerDescriptor& descriptor = *exchange->descriptor;
  std::optional<HandlerResult> result;
  try {
    for (const std::string& root : descriptor.dependencyRoots()) {
      exchange->context->resolveDependency(_dependencies, root);
    }
    if (const auto* syncHandler = std::get_if<SyncHandler>(&descriptor.handler())) {
      result.emplace((*syncHandler)(*exchange->args));
    } else {
      exchange->task = std::get<AsyncHandler>(descriptor.handler())(*exchange->args);
      if (!exchange->task.valid()) {
        throw std::logic_error(std::format("Handler of {} returned an empty task", descriptor.pattern()));
      }
    }
  } catch (...) {
    exchange->task.reset();
    fail(*exchange, CaptureUserException());
    return;
  }

  if (result) {
    completeResult(*exchange, std::move(*result));
    return;
  }

  TaskDriver::Callbacks callbacks;
  callbacks.onCompleted = [this, exchange] {
    std::optional<HandlerResult> taskResult;
    try {
      taskResult.emplace(exchange->task.result());
    } catch (...) {
      exchange->task.reset();
      fail(*exchange, CaptureUserException());
      return;
    }
    exchange->task.reset();
    completeResult(*exchange, std::move(*taskResult));
  };
  callbacks.onAbandoned = [this, exchange](std::exception_ptr error) {
    if (!error) {
      // Nobody is listening anymore, but the connection still expects exactly one response.
      error = std::make_exception_ptr(HttpException(http::StatusCodeServiceUnavailable, "Request cancelled"));
    }
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& ex) {
      deliverUnhooked(*exchange, ex);
    }
  };
  callbacks.onReleased = [exchange] { exchange->task.reset(); };
  callbacks.isCancelled = [exchange] { return exchange->context->isCancelled(); };
  _bridge.drive(exchange->task.handle(), std::move(callbacks), std::move(guard));
}

}  // namespace ignyx
