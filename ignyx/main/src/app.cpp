#include "ignyx/app.hpp"

#include <cstdlib>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/http-method.hpp"
#include "ignyx/log.hpp"

namespace ignyx {

namespace {

AppConfig ApplyEnvironment(AppConfig config) {
  if (const char* levelName = std::getenv("IGNYX_LOG_LEVEL"); levelName != nullptr) {
    if (!SetLogLevel(levelName)) {
      log::warn("Unknown log level '{}' in IGNYX_LOG_LEVEL", levelName);
    }
  }
  config.validate();
  return config;
}

}  // namespace

App::App(AppConfig config)
    : _config(ApplyEnvironment(std::move(config))),
      _dispatcher(_config.dispatcher),
      _websockets(_dispatcher.bridge(), _config.dispatcher.routerConfig, _config.websocket) {}

App::~App() {
  shutdown();
  _dispatcher.stop();
}

App& App::route(http::MethodBmp methods, std::string_view pattern, const Signature& signature, Handler handler,
                std::string name) {
  if (methods == 0) {
    throw std::invalid_argument("A route needs at least one method");
  }
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      _dispatcher.addRoute(method, pattern, signature, handler, name);
    }
  }
  return *this;
}

App& App::websocket(std::string_view pattern, WebSocketHandler handler, std::string name) {
  if (_dispatcher.frozen()) {
    throw std::logic_error("Cannot add a WebSocket route once the application is started");
  }
  _websockets.add(pattern, std::move(handler), std::move(name));
  return *this;
}

App& App::includeRouter(const RouteGroup& group, std::string_view prefix) {
  RouteGroup::CheckPrefix(prefix);
  for (const RouteGroup::HttpRoute& httpRoute : group.httpRoutes()) {
    route(httpRoute.methods, std::string(prefix) + httpRoute.pattern, httpRoute.signature, httpRoute.handler,
          httpRoute.name);
  }
  for (const RouteGroup::WebSocketRoute& wsRoute : group.webSocketRoutes()) {
    websocket(std::string(prefix) + wsRoute.pattern, wsRoute.handler, wsRoute.name);
  }
  return *this;
}

App& App::dependency(std::string name, vector<std::string> subDependencies, DependencyProvider provider,
                     CachePolicy cachePolicy) {
  if (_dispatcher.frozen()) {
    throw std::logic_error("Cannot declare a dependency once the application is started");
  }
  _dispatcher.dependencies().declare(std::move(name), std::move(subDependencies), std::move(provider), cachePolicy);
  return *this;
}

App& App::overrideDependency(std::string_view name, DependencyProvider provider) {
  _dispatcher.dependencies().override(name, std::move(provider));
  return *this;
}

App& App::clearDependencyOverride(std::string_view name) {
  _dispatcher.dependencies().clearOverride(name);
  return *this;
}

App& App::clearDependencyOverrides() {
  _dispatcher.dependencies().clearOverrides();
  return *this;
}

App& App::middleware(MiddlewareEntry entry) {
  _dispatcher.addMiddleware(std::move(entry));
  return *this;
}

App& App::statusHandler(http::StatusCode status, ExceptionHandler handler) {
  _dispatcher.exceptionHandlers().addStatus(status, std::move(handler));
  return *this;
}

App& App::onStartup(std::function<void()> hook) {
  std::lock_guard lock(_lifecycleMutex);
  _startupHooks.push_back(std::move(hook));
  return *this;
}

App& App::onShutdown(std::function<void()> hook) {
  std::lock_guard lock(_lifecycleMutex);
  _shutdownHooks.push_back(std::move(hook));
  return *this;
}

void App::runHooks(vector<std::function<void()>>& hooks, std::string_view what) {
  for (auto& hook : hooks) {
    log::debug("Running {} hook", what);
    _dispatcher.bridge().call(hook);
  }
}

void App::startup() {
  std::lock_guard lock(_lifecycleMutex);
  if (_started) {
    return;
  }
  _dispatcher.freeze();
  runHooks(_startupHooks, "startup");
  _started = true;
  log::info("Application started");
}

void App::shutdown() noexcept {
  std::lock_guard lock(_lifecycleMutex);
  if (!_started) {
    return;
  }
  _started = false;
  for (auto& hook : _shutdownHooks) {
    try {
      _dispatcher.bridge().call(hook);
    } catch (const std::exception& ex) {
      log::error("Shutdown hook failed: {}", ex.what());
    }
  }
  log::info("Application stopped");
}

HttpResponse App::handle(HttpRequest request) {
  startup();
  return _dispatcher.dispatchBlocking(std::move(request));
}

}  // namespace ignyx
