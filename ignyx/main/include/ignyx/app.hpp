#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/app-config.hpp"
#include "ignyx/app-state.hpp"
#include "ignyx/dependency.hpp"
#include "ignyx/dispatcher.hpp"
#include "ignyx/exception-handlers.hpp"
#include "ignyx/handler-descriptor.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/route-group.hpp"
#include "ignyx/signature.hpp"
#include "ignyx/vector.hpp"
#include "ignyx/websocket-service.hpp"

namespace ignyx {

// Application facade: collects routes, dependencies, middlewares, exception handlers and lifecycle hooks, then
// serves them through an HttpServer (or App::handle for in-process calls).
//
//   App app;
//   app.get("/users/{id}", Signature().path("id", Shape::Integer()),
//           SyncHandler([](Arguments& args) -> HandlerResult { return Json(args.get<int64_t>("id")); }));
//   HttpServer(app, ServerConfig{}.withPort(8080)).run();
//
// Registration is single threaded and must be complete before startup() (called by the server), which freezes
// the application. Dependency overrides remain possible afterwards.
class App {
 public:
  explicit App(AppConfig config = {});

  App(const App&) = delete;
  App& operator=(const App&) = delete;

  // Runs the shutdown hooks if startup() was called, then stops the worker pools.
  ~App();

  // Registers 'handler' for each method of 'methods'.
  // Throws RouteConflict, std::invalid_argument for an invalid template or signature, std::logic_error once started.
  App& route(http::MethodBmp methods, std::string_view pattern, const Signature& signature, Handler handler,
             std::string name = {});

  App& get(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::GET), pattern, signature, std::move(handler),
                 std::move(name));
  }

  App& get(std::string_view pattern, Handler handler, std::string name = {}) {
    return get(pattern, Signature{}, std::move(handler), std::move(name));
  }

  App& post(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::POST), pattern, signature, std::move(handler),
                 std::move(name));
  }

  App& post(std::string_view pattern, Handler handler, std::string name = {}) {
    return post(pattern, Signature{}, std::move(handler), std::move(name));
  }

  App& put(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::PUT), pattern, signature, std::move(handler),
                 std::move(name));
  }

  App& patch(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::PATCH), pattern, signature, std::move(handler),
                 std::move(name));
  }

  App& del(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::DELETE), pattern, signature, std::move(handler),
                 std::move(name));
  }

  App& options(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::OPTIONS), pattern, signature, std::move(handler),
                 std::move(name));
  }

  App& head(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::HEAD), pattern, signature, std::move(handler),
                 std::move(name));
  }

  App& websocket(std::string_view pattern, WebSocketHandler handler, std::string name = {});

  // Mounts the routes of 'group' under 'prefix'.
  App& includeRouter(const RouteGroup& group, std::string_view prefix = {});

  // Declares a named dependency. Throws std::invalid_argument for a duplicate name, CyclicDependency on a cycle.
  App& dependency(std::string name, vector<std::string> subDependencies, DependencyProvider provider,
                  CachePolicy cachePolicy = CachePolicy::PerRequest);

  App& dependency(std::string name, DependencyProvider provider, CachePolicy cachePolicy = CachePolicy::PerRequest) {
    return dependency(std::move(name), {}, std::move(provider), cachePolicy);
  }

  // Replaces the provider of a declared dependency (for tests). Allowed at any time.
  App& overrideDependency(std::string_view name, DependencyProvider provider);

  App& clearDependencyOverride(std::string_view name);

  App& clearDependencyOverrides();

  // Adds an outer layer to the middleware onion: the first registered middleware is the outermost one.
  App& middleware(MiddlewareEntry entry);

  App& middleware(std::string name, RequestMiddleware before, ResponseMiddleware after = {},
                  ErrorMiddleware onError = {}) {
    return middleware(MiddlewareEntry{std::move(name), std::move(before), std::move(after), std::move(onError)});
  }

  // Converts exceptions of type E (or derived from it) raised while handling a request.
  template <class E>
    requires std::derived_from<E, std::exception>
  App& exceptionHandler(std::function<HttpResponse(const HttpRequest&, const E&)> handler) {
    _dispatcher.exceptionHandlers().add<E>(std::move(handler));
    return *this;
  }

  // Converts exceptions associated to 'status' (HttpException, validation errors, lock timeouts...) that no
  // typed handler claimed.
  App& statusHandler(http::StatusCode status, ExceptionHandler handler);

  // Hooks run under the call-lock, in registration order, when the application starts and stops.
  App& onStartup(std::function<void()> hook);

  App& onShutdown(std::function<void()> hook);

  // Freezes the registration and runs the startup hooks. Idempotent. Exceptions from a hook propagate and leave
  // the application not started.
  void startup();

  // Runs the shutdown hooks, failures are logged. Idempotent, no-op if not started.
  void shutdown() noexcept;

  [[nodiscard]] bool started() const noexcept { return _started; }

  // Processes 'request' in-process, through the whole engine (middlewares, background tasks and teardowns
  // included). Starts the application if needed.
  HttpResponse handle(HttpRequest request);

  [[nodiscard]] AppState& state() noexcept { return _state; }

  [[nodiscard]] Dispatcher& dispatcher() noexcept { return _dispatcher; }

  [[nodiscard]] WebSocketService& websockets() noexcept { return _websockets; }

  [[nodiscard]] const AppConfig& config() const noexcept { return _config; }

 private:
  void runHooks(vector<std::function<void()>>& hooks, std::string_view what);

  AppConfig _config;
  Dispatcher _dispatcher;
  WebSocketService _websockets;
  AppState _state;
  vector<std::function<void()>> _startupHooks;
  vector<std::function<void()>> _shutdownHooks;
  std::mutex _lifecycleMutex;
  bool _started{false};
};

}  // namespace ignyx
