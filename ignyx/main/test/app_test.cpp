#include "ignyx/app.hpp"

#include <gtest/gtest.h>

#include <any>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "ignyx/app-config.hpp"
#include "ignyx/arguments.hpp"
#include "ignyx/dependency.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/handler-result.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/route-group.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/signature.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

namespace {

AppConfig TestConfig() { return AppConfig{}.withWorkerThreads(4).withOffloadThreads(1); }

HttpRequest Get(std::string_view target) { return HttpRequest::FromParts(http::Method::GET, target); }

}  // namespace

TEST(App, HandleRunsTheWholeEngine) {
  App app(TestConfig());
  vector<std::string> events;
  app.middleware("trace", [&events](HttpRequest&) {
    events.emplace_back("before");
    return MiddlewareResult::Continue();
  });
  app.get("/users/{id}", Signature().path("id", Shape::Integer()),
          SyncHandler([&events](Arguments& args) -> HandlerResult {
            events.emplace_back("handler");
            Json body = JsonObject();
            body["id"] = static_cast<double>(args.get<int64_t>("id"));
            return body;
          }));

  EXPECT_FALSE(app.started());
  const HttpResponse response = app.handle(Get("/users/7"));
  EXPECT_TRUE(app.started());
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), R"({"id":7})");
  const vector<std::string> expected{"before", "handler"};
  EXPECT_EQ(events, expected);

  EXPECT_EQ(app.handle(Get("/users/x")).status(), http::StatusCodeUnprocessableEntity);
  EXPECT_EQ(app.handle(Get("/nowhere")).status(), http::StatusCodeNotFound);
}

TEST(App, RouteWithSeveralMethods) {
  App app(TestConfig());
  app.route(http::Method::PUT | http::Method::PATCH, "/items/{id}", Signature().path("id", Shape::Integer()),
            SyncHandler([](Arguments& args) -> HandlerResult {
              return std::string(http::MethodToStr(args.request().method()));
            }));

  EXPECT_EQ(app.handle(HttpRequest::FromParts(http::Method::PUT, "/items/1")).body(), "PUT");
  EXPECT_EQ(app.handle(HttpRequest::FromParts(http::Method::PATCH, "/items/1")).body(), "PATCH");
  EXPECT_EQ(app.handle(Get("/items/1")).status(), http::StatusCodeMethodNotAllowed);

  EXPECT_THROW(app.route(0, "/none", Signature(), SyncHandler([](Arguments&) -> HandlerResult { return "x"; })),
               std::invalid_argument);
}

TEST(App, RegistrationIsFrozenOnceStarted) {
  App app(TestConfig());
  app.startup();
  EXPECT_THROW(app.get("/late", SyncHandler([](Arguments&) -> HandlerResult { return "late"; })), std::logic_error);
  EXPECT_THROW(app.dependency("db", [](DependencyScope&) -> std::any { return 1; }), std::logic_error);
  // Idempotent
  app.startup();
}

TEST(App, IncludeRouterPrefixesGroupRoutes) {
  RouteGroup users("/users");
  users.get("/{id}", Signature().path("id", Shape::Integer()), SyncHandler([](Arguments& args) -> HandlerResult {
              return "user " + std::to_string(args.get<int64_t>("id"));
            }));
  users.get("", SyncHandler([](Arguments&) -> HandlerResult { return "all users"; }));

  App app(TestConfig());
  app.includeRouter(users, "/api/v1");

  EXPECT_EQ(app.handle(Get("/api/v1/users/3")).body(), "user 3");
  EXPECT_EQ(app.handle(Get("/api/v1/users")).body(), "all users");
  EXPECT_EQ(app.handle(Get("/users/3")).status(), http::StatusCodeNotFound);

  EXPECT_THROW(app.includeRouter(users, "api"), std::invalid_argument);
}

TEST(App, DependencyOverride) {
  App app(TestConfig());
  app.dependency("greeting", [](DependencyScope&) -> std::any { return std::string("hello"); });
  app.get("/greet", Signature().depends("greeting"), SyncHandler([](Arguments& args) -> HandlerResult {
            return args.dependency<std::string>("greeting");
          }));

  EXPECT_EQ(app.handle(Get("/greet")).body(), "hello");

  app.overrideDependency("greeting", [](DependencyScope&) -> std::any { return std::string("mocked"); });
  EXPECT_EQ(app.handle(Get("/greet")).body(), "mocked");

  app.clearDependencyOverrides();
  EXPECT_EQ(app.handle(Get("/greet")).body(), "hello");
}

TEST(App, ExceptionAndStatusHandlers) {
  struct OutOfStock : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  App app(TestConfig());
  app.exceptionHandler<OutOfStock>([](const HttpRequest&, const OutOfStock& ex) {
    return HttpResponse::PlainText(ex.what(), http::StatusCodeConflict);
  });
  app.statusHandler(http::StatusCodeNotFound, [](const HttpRequest& request, const std::exception&) {
    return HttpResponse::PlainText("nothing at " + std::string(request.path()), http::StatusCodeNotFound);
  });
  app.get("/buy", SyncHandler([](Arguments&) -> HandlerResult { throw OutOfStock("sold out"); }));
  app.get("/gone", SyncHandler([](Arguments&) -> HandlerResult { throw HttpException(http::StatusCodeNotFound); }));

  HttpResponse response = app.handle(Get("/buy"));
  EXPECT_EQ(response.status(), http::StatusCodeConflict);
  EXPECT_EQ(response.body(), "sold out");

  response = app.handle(Get("/gone"));
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.body(), "nothing at /gone");
}

TEST(App, LifecycleHooks) {
  vector<std::string> events;
  {
    App app(TestConfig());
    app.onStartup([&events] { events.emplace_back("open pool"); });
    app.onStartup([&events] { events.emplace_back("warm cache"); });
    app.onShutdown([&events] { events.emplace_back("close pool"); });
    app.onShutdown([] { throw std::runtime_error("logged only"); });
    app.onShutdown([&events] { events.emplace_back("flush"); });

    app.shutdown();  // not started: no-op
    EXPECT_TRUE(events.empty());

    app.startup();
    app.startup();
    const vector<std::string> started{"open pool", "warm cache"};
    EXPECT_EQ(events, started);
  }
  const vector<std::string> expected{"open pool", "warm cache", "close pool", "flush"};
  EXPECT_EQ(events, expected);
}

TEST(App, FailingStartupHookLeavesTheAppStopped) {
  App app(TestConfig());
  app.onStartup([] { throw std::runtime_error("database unreachable"); });
  EXPECT_THROW(app.startup(), std::runtime_error);
  EXPECT_FALSE(app.started());
}

TEST(App, StateIsSharedWithHandlers) {
  App app(TestConfig());
  app.state().set("counter", int64_t{0});
  app.get("/hit", SyncHandler([&app](Arguments&) -> HandlerResult {
            auto& counter = app.state().get<int64_t>("counter");
            return std::to_string(++counter);
          }));

  EXPECT_EQ(app.handle(Get("/hit")).body(), "1");
  EXPECT_EQ(app.handle(Get("/hit")).body(), "2");
  EXPECT_EQ(app.state().get<int64_t>("counter"), 2);
}

TEST(App, InvalidConfigIsRejected) {
  EXPECT_THROW(App(AppConfig{}.withWorkerThreads(4).withCallLockTimeout(std::chrono::milliseconds{-1})),
               std::invalid_argument);
}

}  // namespace ignyx
