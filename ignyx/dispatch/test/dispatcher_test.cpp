#include "ignyx/dispatcher.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <any>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "ignyx/arguments.hpp"
#include "ignyx/dispatcher-config.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/handler-result.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/request-context.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/signature.hpp"
#include "ignyx/suspension.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

namespace {

struct NewItem {
  std::string name;
  double price{};
  std::vector<std::string> tags;
};

DispatcherConfig TestConfig(std::chrono::milliseconds lockTimeout = std::chrono::seconds{5}) {
  DispatcherConfig config;
  config.withWorkerThreads(8).withOffloadThreads(2).withCallLockTimeout(lockTimeout);
  return config;
}

Json BodyJson(const HttpResponse& response) {
  auto json = ParseJson(response.body());
  if (!json) {
    ADD_FAILURE() << "not a JSON body: " << response.body();
    return Json{};
  }
  return std::move(*json);
}

Shape NewItemShape() {
  vector<Shape::Field> fields;
  fields.push_back(Shape::Field{"name", Shape::String(), true, {}});
  fields.push_back(Shape::Field{"price", Shape::Float(), true, {}});
  fields.push_back(Shape::Field{"tags", Shape::Array(Shape::String()), false, JsonArray()});
  return Shape::Object(std::move(fields));
}

}  // namespace

class DispatcherTest : public ::testing::Test {
 protected:
  HttpResponse get(std::string_view target,
                   std::initializer_list<std::pair<std::string_view, std::string_view>> headers = {}) {
    return dispatcher.dispatchBlocking(HttpRequest::FromParts(http::Method::GET, target, headers));
  }

  HttpResponse post(std::string_view target, std::string body, std::string_view contentType = "application/json") {
    return dispatcher.dispatchBlocking(
        HttpRequest::FromParts(http::Method::POST, target, {{"Content-Type", contentType}}, std::move(body)));
  }

  Dispatcher dispatcher{TestConfig()};
};

TEST_F(DispatcherTest, PathParameterIsCoercedToItsDeclaredType) {
  dispatcher.addRoute(http::Method::GET, "/users/{id}", Signature().path("id", Shape::Integer()),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        Json body = JsonObject();
                        body["id"] = static_cast<double>(args.get<int64_t>("id") + 1);
                        return body;
                      }));
  dispatcher.freeze();

  HttpResponse response = get("/users/42");
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeApplicationJson);
  EXPECT_EQ(BodyJson(response)["id"].get<double>(), 43.0);

  response = get("/users/abc");
  EXPECT_EQ(response.status(), http::StatusCodeUnprocessableEntity);
  Json body = BodyJson(response);
  ASSERT_EQ(body["detail"].get_array().size(), 1U);
  Json& error = body["detail"][0];
  EXPECT_EQ(DumpJson(error["loc"]), R"(["path","id"])");
  EXPECT_EQ(error["type"].get<std::string>(), "int_parsing");
  EXPECT_EQ(error["input"].get<std::string>(), "abc");
}

TEST_F(DispatcherTest, IntegerParametersKeepTheirFullRange) {
  dispatcher.addRoute(http::Method::GET, "/users/{id}",
                      Signature().path("id", Shape::Integer()).query("ids", Shape::Array(Shape::Integer()), JsonArray()),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        return std::to_string(args.get<int64_t>("id"));
                      }));
  dispatcher.freeze();

  EXPECT_EQ(get("/users/9007199254740993").body(), "9007199254740993");
  EXPECT_EQ(get("/users/9223372036854775807").body(), "9223372036854775807");
  EXPECT_EQ(get("/users/-9223372036854775808").body(), "-9223372036854775808");
  EXPECT_EQ(get("/users/9223372036854775808").status(), http::StatusCodeUnprocessableEntity);

  // Array elements are Json numbers: out of their exact range is a parsing error, not a rounded value.
  EXPECT_EQ(get("/users/1?ids=9007199254740992").status(), http::StatusCodeOK);
  const HttpResponse response = get("/users/1?ids=9007199254740993");
  EXPECT_EQ(response.status(), http::StatusCodeUnprocessableEntity);
  Json body = BodyJson(response);
  EXPECT_EQ(DumpJson(body["detail"][0]["loc"]), R"(["query","ids",0])");
  EXPECT_EQ(body["detail"][0]["type"].get<std::string>(), "int_parsing");
}

TEST_F(DispatcherTest, PathParametersAreDecodedAfterRouting) {
  dispatcher.addRoute(http::Method::GET, "/files/{name}", Signature().path("name"),
                      SyncHandler([](Arguments& args) -> HandlerResult { return args.get<std::string>("name"); }));
  dispatcher.freeze();

  const HttpResponse response = get("/files/reports%2F2024%20Q1.pdf");
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "reports/2024 Q1.pdf");
  EXPECT_EQ(get("/files/reports/2024").status(), http::StatusCodeNotFound);
}

TEST_F(DispatcherTest, QueryParametersWithDefaultsAndRepetitions) {
  dispatcher.addRoute(http::Method::GET, "/search",
                      Signature()
                          .query("q")
                          .query("page", Shape::Integer(), Json(1.0))
                          .query("tag", Shape::Array(Shape::Integer()), JsonArray())
                          .query("verbose", Shape::Boolean(), Json{}),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        Json body = JsonObject();
                        body["q"] = args.get<std::string>("q");
                        body["page"] = static_cast<double>(args.get<int>("page"));
                        body["tags"] = args.get<Json>("tag");
                        body["verbose"] = args.getOptional<bool>("verbose").has_value();
                        return body;
                      }));

  EXPECT_EQ(get("/search?q=caf%C3%A9+noir&tag=1&tag=2").body(),
            R"({"page":1,"q":"café noir","tags":[1,2],"verbose":false})");
  EXPECT_EQ(BodyJson(get("/search?q=x&page=3&verbose=yes"))["verbose"].get<bool>(), true);

  const HttpResponse response = get("/search?page=two&tag=1&tag=x");
  EXPECT_EQ(response.status(), http::StatusCodeUnprocessableEntity);
  Json body = BodyJson(response);
  auto& errors = body["detail"].get_array();
  ASSERT_EQ(errors.size(), 3U);
  EXPECT_EQ(DumpJson(errors[0]["loc"]), R"(["query","q"])");
  EXPECT_EQ(errors[0]["type"].get<std::string>(), "missing");
  EXPECT_EQ(DumpJson(errors[1]["loc"]), R"(["query","page"])");
  EXPECT_EQ(DumpJson(errors[2]["loc"]), R"(["query","tag",1])");
}

TEST_F(DispatcherTest, HeaderAndCookieParameters) {
  dispatcher.addRoute(http::Method::GET, "/whoami",
                      Signature().header("user_agent").cookie("session", Shape::String(), Json(std::string("anon"))),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        return args.get<std::string>("user_agent") + "/" + args.get<std::string>("session");
                      }));

  EXPECT_EQ(get("/whoami", {{"User-Agent", "curl"}, {"Cookie", "session=s1"}}).body(), "curl/s1");
  EXPECT_EQ(get("/whoami", {{"user-agent", "curl"}}).body(), "curl/anon");
  EXPECT_EQ(get("/whoami").status(), http::StatusCodeUnprocessableEntity);
}

TEST_F(DispatcherTest, JsonBodyIsValidatedAndReadIntoAggregates) {
  dispatcher.addRoute(http::Method::POST, "/items", Signature().body("item", NewItemShape()),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        const auto item = args.get<NewItem>("item");
                        return HandlerResult(HandlerResult::Serialize(item), http::StatusCodeCreated);
                      }));

  HttpResponse response = post("/items", R"({"name":"pen","price":"2.5"})");
  EXPECT_EQ(response.status(), http::StatusCodeCreated);
  EXPECT_EQ(response.body(), R"({"name":"pen","price":2.5,"tags":[]})");

  response = post("/items", R"({"name":"pen")");
  EXPECT_EQ(response.status(), http::StatusCodeUnprocessableEntity);
  Json body = BodyJson(response);
  EXPECT_EQ(DumpJson(body["detail"][0]["loc"]), R"(["body"])");
  EXPECT_EQ(body["detail"][0]["type"].get<std::string>(), "json_invalid");

  response = post("/items", R"({"name":"pen","tags":[1]})");
  body = BodyJson(response);
  ASSERT_EQ(body["detail"].get_array().size(), 2U);
  EXPECT_EQ(DumpJson(body["detail"][0]["loc"]), R"(["body","price"])");
  EXPECT_EQ(DumpJson(body["detail"][1]["loc"]), R"(["body","tags",0])");

  EXPECT_EQ(post("/items", "").status(), http::StatusCodeUnprocessableEntity);
}

TEST_F(DispatcherTest, SeveralBodyParametersAreEmbedded) {
  dispatcher.addRoute(http::Method::POST, "/transfer",
                      Signature().body("from", Shape::String()).body("amount", Shape::Integer()),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        return args.get<std::string>("from") + ":" + std::to_string(args.get<int64_t>("amount"));
                      }));
  EXPECT_EQ(post("/transfer", R"({"from":"alice","amount":10})").body(), "alice:10");
  const Json body = BodyJson(post("/transfer", "[1]"));
  EXPECT_EQ(DumpJson(body), R"({"detail":[{"input":[1],"loc":["body"],"msg":"Input should be a valid dictionary","type":"dict_type"}]})");
}

TEST_F(DispatcherTest, UrlEncodedFormFields) {
  dispatcher.addRoute(http::Method::POST, "/login", Signature().form("username").form("remember", Shape::Boolean(), Json(false)),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        return args.get<std::string>("username") + (args.get<bool>("remember") ? "+" : "-");
                      }));
  EXPECT_EQ(post("/login", "username=Bob+Smith&remember=on", "application/x-www-form-urlencoded").body(),
            "Bob Smith+");
  EXPECT_EQ(post("/login", "username=eve", "application/x-www-form-urlencoded").body(), "eve-");
}

TEST_F(DispatcherTest, RoutingErrors) {
  dispatcher.addRoute(http::Method::GET, "/items/{id}", Signature().path("id"),
                      SyncHandler([](Arguments&) -> HandlerResult { return "item"; }));
  dispatcher.addRoute(http::Method::PUT, "/items/{id}", Signature().path("id"),
                      SyncHandler([](Arguments&) -> HandlerResult { return "updated"; }));

  HttpResponse response = get("/nothing");
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.body(), R"({"detail":"Not Found"})");

  response = dispatcher.dispatchBlocking(HttpRequest::FromParts(http::Method::DELETE, "/items/1"));
  EXPECT_EQ(response.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(response.headerValue(http::Allow), "GET, HEAD, PUT");

  response = dispatcher.dispatchBlocking(HttpRequest::FromParts(http::Method::OPTIONS, "/items/1"));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.headerValue(http::Allow), "GET, HEAD, PUT, OPTIONS");

  response = dispatcher.dispatchBlocking(HttpRequest::FromParts(http::Method::HEAD, "/items/1"));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
}

TEST_F(DispatcherTest, MiddlewareOnionOrder) {
  vector<std::string> events;
  for (std::string name : {"outer", "inner"}) {
    dispatcher.addMiddleware(MiddlewareEntry{
        name,
        [&events, name](HttpRequest&) {
          events.push_back(name + ".before");
          return MiddlewareResult::Continue();
        },
        [&events, name](const HttpRequest&, HttpResponse& response) {
          events.push_back(name + ".after");
          response.addHeader("X-Layers", name);
        },
        {}});
  }
  dispatcher.addRoute(http::Method::GET, "/", Signature(), SyncHandler([&events](Arguments&) -> HandlerResult {
                        events.emplace_back("handler");
                        return "ok";
                      }));

  const HttpResponse response = get("/");
  EXPECT_EQ(response.body(), "ok");
  const vector<std::string> expected{"outer.before", "inner.before", "handler", "inner.after", "outer.after"};
  EXPECT_EQ(events, expected);
  const auto layers = response.headers().getAll("X-Layers");
  ASSERT_EQ(layers.size(), 2U);
  EXPECT_EQ(layers[0], "inner");
  EXPECT_EQ(layers[1], "outer");
}

TEST_F(DispatcherTest, ShortCircuitSkipsHandlerAndInnerLayers) {
  vector<std::string> events;
  dispatcher.addMiddleware(MiddlewareEntry{"auth",
                                           [&events](HttpRequest& request) {
                                             events.emplace_back("auth.before");
                                             if (!request.headerValue("Authorization")) {
                                               return MiddlewareResult::ShortCircuit(
                                                   HttpResponse::PlainText("denied", http::StatusCodeUnauthorized));
                                             }
                                             return MiddlewareResult::Continue();
                                           },
                                           [&events](const HttpRequest&, HttpResponse&) {
                                             events.emplace_back("auth.after");
                                           },
                                           {}});
  dispatcher.addMiddleware(MiddlewareEntry{"inner",
                                           [&events](HttpRequest&) {
                                             events.emplace_back("inner.before");
                                             return MiddlewareResult::Continue();
                                           },
                                           {},
                                           {}});
  int nbCalls = 0;
  dispatcher.addRoute(http::Method::GET, "/private", Signature(), SyncHandler([&nbCalls](Arguments&) -> HandlerResult {
                        ++nbCalls;
                        return "secret";
                      }));

  // Before-hooks run prior to routing: unknown paths are rejected as well.
  for (std::string_view target : {"/private", "/unknown"}) {
    events.clear();
    const HttpResponse response = get(target);
    EXPECT_EQ(response.status(), http::StatusCodeUnauthorized);
    EXPECT_EQ(response.body(), "denied");
    const vector<std::string> expected{"auth.before", "auth.after"};
    EXPECT_EQ(events, expected);
  }
  EXPECT_EQ(nbCalls, 0);
  EXPECT_EQ(get("/private", {{"Authorization", "Bearer t"}}).body(), "secret");
}

TEST_F(DispatcherTest, ErrorHooksRunInnermostFirst) {
  vector<std::string> events;
  dispatcher.addMiddleware(MiddlewareEntry{
      "outer", {}, [&events](const HttpRequest&, HttpResponse&) { events.emplace_back("outer.after"); },
      [&events](const HttpRequest&, const std::exception& ex) -> std::optional<HttpResponse> {
        events.emplace_back("outer.error");
        return HttpResponse::PlainText(std::string("recovered: ") + ex.what(), http::StatusCodeBadGateway);
      }});
  dispatcher.addMiddleware(
      MiddlewareEntry{"inner", {}, {}, [&events](const HttpRequest&, const std::exception&) -> std::optional<HttpResponse> {
                        events.emplace_back("inner.error");
                        return std::nullopt;
                      }});
  dispatcher.addRoute(http::Method::GET, "/fail", Signature(), SyncHandler([](Arguments&) -> HandlerResult {
                        throw std::runtime_error("boom");
                      }));

  const HttpResponse response = get("/fail");
  EXPECT_EQ(response.status(), http::StatusCodeBadGateway);
  EXPECT_EQ(response.body(), "recovered: boom");
  const vector<std::string> expected{"inner.error", "outer.error", "outer.after"};
  EXPECT_EQ(events, expected);
}

TEST_F(DispatcherTest, ExceptionsAreConverted) {
  struct OutOfStock : std::runtime_error {
    OutOfStock() : std::runtime_error("out of stock") {}
  };
  dispatcher.exceptionHandlers().add<OutOfStock>([](const HttpRequest&, const OutOfStock& ex) {
    return HttpResponse::PlainText(ex.what(), http::StatusCodeConflict);
  });
  dispatcher.addRoute(http::Method::GET, "/stock", Signature(),
                      SyncHandler([](Arguments&) -> HandlerResult { throw OutOfStock(); }));
  dispatcher.addRoute(http::Method::GET, "/teapot", Signature(), SyncHandler([](Arguments&) -> HandlerResult {
                        throw HttpException(418, "short and stout", HeaderMap().append("X-Teapot", "1"));
                      }));
  dispatcher.addRoute(http::Method::GET, "/int", Signature(),
                      SyncHandler([](Arguments&) -> HandlerResult { throw 42; }));

  EXPECT_EQ(get("/stock").status(), http::StatusCodeConflict);

  HttpResponse response = get("/teapot");
  EXPECT_EQ(response.status(), 418);
  EXPECT_EQ(response.body(), R"({"detail":"short and stout"})");
  EXPECT_EQ(response.headerValue("X-Teapot"), "1");

  response = get("/int");
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body(), R"({"detail":"Internal Server Error"})");
}

TEST_F(DispatcherTest, DependenciesAreInjectedOncePerRequest) {
  std::atomic<int> nbDbCalls{0};
  dispatcher.dependencies().declare("db", {}, [&nbDbCalls](DependencyScope&) { return std::any(++nbDbCalls); });
  dispatcher.dependencies().declare("repo", {"db"}, [](DependencyScope& scope) {
    return std::any(std::string("repo#") + std::to_string(scope.get<int>("db")));
  });
  dispatcher.addRoute(http::Method::GET, "/", Signature().depends("repo").depends("conn", "db"),
                      SyncHandler([](Arguments& args) -> HandlerResult {
                        return args.dependency<std::string>("repo") + "/" +
                               std::to_string(args.dependency<int>("conn"));
                      }));
  dispatcher.freeze();

  EXPECT_EQ(get("/").body(), "repo#1/1");
  EXPECT_EQ(get("/").body(), "repo#2/2");

  dispatcher.dependencies().override("db", [](DependencyScope&) { return std::any(100); });
  EXPECT_EQ(get("/").body(), "repo#100/100");
  dispatcher.dependencies().clearOverrides();
  EXPECT_EQ(get("/").body(), "repo#3/3");
}

TEST_F(DispatcherTest, ConcurrentRequestsNeverOverlapInUserCode) {
  static constexpr int kNbRequests = 50;
  std::atomic<int> nbCalls{0};
  std::atomic<int> active{0};
  std::atomic<int> maxActive{0};
  dispatcher.dependencies().declare("counter", {}, [&](DependencyScope&) {
    const int nowActive = ++active;
    maxActive = std::max(maxActive.load(), nowActive);
    std::this_thread::sleep_for(std::chrono::microseconds{200});
    ++nbCalls;
    --active;
    return std::any(nbCalls.load());
  });
  dispatcher.addRoute(http::Method::GET, "/count", Signature().depends("counter"),
                      SyncHandler([this](Arguments& args) -> HandlerResult {
                        EXPECT_TRUE(dispatcher.callLock().heldByCurrentThread());
                        return std::to_string(args.dependency<int>("counter"));
                      }));
  dispatcher.freeze();

  std::vector<std::jthread> clients;
  std::atomic<int> nbOk{0};
  for (int requestPos = 0; requestPos < kNbRequests; ++requestPos) {
    clients.emplace_back([this, &nbOk] {
      if (get("/count").status() == http::StatusCodeOK) {
        ++nbOk;
      }
    });
  }
  clients.clear();

  EXPECT_EQ(nbOk.load(), kNbRequests);
  EXPECT_EQ(nbCalls.load(), kNbRequests);
  EXPECT_EQ(maxActive.load(), 1);
}

TEST_F(DispatcherTest, SuspendedHandlersReleaseTheCallLock) {
  static constexpr int kNbRequests = 4;
  static constexpr auto kSleep = std::chrono::milliseconds{200};
  dispatcher.addRoute(http::Method::GET, "/slow", Signature(),
                      AsyncHandler([this](Arguments&) -> HandlerTask<HandlerResult> {
                        co_await SleepFor(kSleep);
                        EXPECT_TRUE(dispatcher.callLock().heldByCurrentThread());
                        co_return "rested";
                      }));
  dispatcher.freeze();

  const auto start = std::chrono::steady_clock::now();
  std::vector<std::jthread> clients;
  std::atomic<int> nbOk{0};
  for (int requestPos = 0; requestPos < kNbRequests; ++requestPos) {
    clients.emplace_back([this, &nbOk] {
      if (get("/slow").body() == "rested") {
        ++nbOk;
      }
    });
  }
  clients.clear();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(nbOk.load(), kNbRequests);
  EXPECT_LT(elapsed, kSleep * (kNbRequests - 1));
}

TEST_F(DispatcherTest, OffloadRunsOutsideTheCallLock) {
  dispatcher.addRoute(http::Method::GET, "/compute", Signature().query("n", Shape::Integer()),
                      AsyncHandler([this](Arguments& args) -> HandlerTask<HandlerResult> {
                        const int64_t n = args.get<int64_t>("n");
                        const int64_t square = co_await Offload([this, n] {
                          EXPECT_FALSE(dispatcher.callLock().heldByCurrentThread());
                          return n * n;
                        });
                        co_return std::to_string(square);
                      }));
  dispatcher.addRoute(http::Method::GET, "/offload-error", Signature(),
                      AsyncHandler([](Arguments&) -> HandlerTask<HandlerResult> {
                        co_await Offload([] { throw HttpException(http::StatusCodeBadGateway, "upstream"); });
                        co_return "unreachable";
                      }));

  EXPECT_EQ(get("/compute?n=12").body(), "144");
  EXPECT_EQ(get("/offload-error").status(), http::StatusCodeBadGateway);
}

TEST_F(DispatcherTest, CancelledSuspendedRequestIsAnsweredWith503) {
  std::atomic<bool> resumed{false};
  dispatcher.addRoute(http::Method::GET, "/slow", Signature(),
                      AsyncHandler([&resumed](Arguments&) -> HandlerTask<HandlerResult> {
                        co_await SleepFor(std::chrono::milliseconds{50});
                        resumed = true;
                        co_return "late";
                      }));

  auto context = std::make_shared<RequestContext>(HttpRequest::FromParts(http::Method::GET, "/slow"));
  std::promise<HttpResponse> promise;
  auto future = promise.get_future();
  dispatcher.dispatch(context, [&promise](HttpResponse response) { promise.set_value(std::move(response)); });
  context->cancel();
  const HttpResponse response = future.get();
  EXPECT_EQ(response.status(), http::StatusCodeServiceUnavailable);
  EXPECT_FALSE(resumed.load());
}

TEST(Dispatcher, LockTimeoutAnswers503) {
  Dispatcher dispatcher(TestConfig(std::chrono::milliseconds{30}));
  bool called = false;
  dispatcher.addRoute(http::Method::GET, "/", Signature(), SyncHandler([&called](Arguments&) -> HandlerResult {
                        called = true;
                        return "ok";
                      }));
  dispatcher.freeze();

  dispatcher.callLock().lock();
  auto context = std::make_shared<RequestContext>(HttpRequest::FromParts(http::Method::GET, "/"));
  std::promise<HttpResponse> promise;
  auto future = promise.get_future();
  dispatcher.dispatch(context, [&promise](HttpResponse response) { promise.set_value(std::move(response)); });
  const HttpResponse response = future.get();
  dispatcher.callLock().unlock();

  EXPECT_EQ(response.status(), http::StatusCodeServiceUnavailable);
  EXPECT_EQ(response.body(), R"({"detail":"Service Unavailable"})");
  EXPECT_FALSE(called);
  EXPECT_EQ(dispatcher.callLock().stats().timeouts, 1U);
}

TEST(Dispatcher, SuspendedHandlerTimingOutAnswers503WhileTheLockIsStillHeld) {
  constexpr auto kLockTimeout = std::chrono::milliseconds{30};
  Dispatcher dispatcher(TestConfig(kLockTimeout));
  std::promise<void> started;
  std::atomic<bool> resumed{false};
  dispatcher.addRoute(http::Method::GET, "/", Signature(),
                      AsyncHandler([&started, &resumed](Arguments&) -> HandlerTask<HandlerResult> {
                        started.set_value();
                        co_await SleepFor(std::chrono::milliseconds{10});
                        resumed = true;
                        co_return "late";
                      }));
  dispatcher.freeze();

  auto context = std::make_shared<RequestContext>(HttpRequest::FromParts(http::Method::GET, "/"));
  std::promise<HttpResponse> promise;
  auto future = promise.get_future();
  dispatcher.dispatch(context, [&promise](HttpResponse response) { promise.set_value(std::move(response)); });

  started.get_future().wait();
  // Granted once the handler suspended, then kept until the response arrived.
  dispatcher.callLock().lock();
  const auto status = future.wait_for(std::chrono::seconds{2});
  dispatcher.callLock().unlock();

  ASSERT_EQ(status, std::future_status::ready);
  EXPECT_EQ(future.get().status(), http::StatusCodeServiceUnavailable);
  EXPECT_FALSE(resumed);
}

TEST_F(DispatcherTest, TeardownsRunEvenWhenTheHandlerFails) {
  vector<std::string> events;
  dispatcher.dependencies().declare("tx", {}, [&events](DependencyScope& scope) {
    events.emplace_back("begin");
    scope.onTeardown([&events] { events.emplace_back("rollback"); });
    return std::any(0);
  });
  dispatcher.addRoute(http::Method::GET, "/", Signature().depends("tx"), SyncHandler([&events](Arguments&) -> HandlerResult {
                        events.emplace_back("handler");
                        throw std::runtime_error("failed");
                      }));

  EXPECT_EQ(get("/").status(), http::StatusCodeInternalServerError);
  const vector<std::string> expected{"begin", "handler", "rollback"};
  EXPECT_EQ(events, expected);
}

TEST_F(DispatcherTest, BackgroundTasksRunOnlyOnceTheResponseIsSent) {
  vector<std::string> events;
  dispatcher.addRoute(http::Method::POST, "/signup", Signature().backgroundTasks(),
                      SyncHandler([&events](Arguments& args) -> HandlerResult {
                        args.backgroundTasks().add([&events] { events.emplace_back("email"); });
                        args.backgroundTasks().add([] { throw std::runtime_error("logged, not fatal"); });
                        args.backgroundTasks().add([&events] { events.emplace_back("audit"); });
                        return "registered";
                      }));

  for (bool sent : {false, true}) {
    events.clear();
    auto context = std::make_shared<RequestContext>(HttpRequest::FromParts(http::Method::POST, "/signup"));
    std::promise<HttpResponse> promise;
    auto future = promise.get_future();
    dispatcher.dispatch(context, [&promise](HttpResponse response) { promise.set_value(std::move(response)); });
    EXPECT_EQ(future.get().body(), "registered");
    EXPECT_TRUE(events.empty());
    dispatcher.finalizeNow(*context, sent);
    if (sent) {
      const vector<std::string> expected{"email", "audit"};
      EXPECT_EQ(events, expected);
    } else {
      EXPECT_TRUE(events.empty());
    }
    EXPECT_TRUE(context->backgroundTasks().empty());
  }
}

TEST_F(DispatcherTest, StreamingBodyIsPulledUnderTheCallLock) {
  dispatcher.addRoute(http::Method::GET, "/stream", Signature(), SyncHandler([this](Arguments&) -> HandlerResult {
                        auto remaining = std::make_shared<int>(3);
                        HttpResponse response;
                        response.streamingBody(
                            [this, remaining]() -> std::optional<std::string> {
                              EXPECT_TRUE(dispatcher.callLock().heldByCurrentThread());
                              if (*remaining == 0) {
                                return std::nullopt;
                              }
                              return std::to_string((*remaining)--);
                            },
                            "text/plain");
                        return response;
                      }));

  HttpResponse response = get("/stream");
  ASSERT_TRUE(response.isStreaming());
  auto source = response.takeChunkSource();
  std::string body;
  while (auto chunk = source()) {
    body.append(*chunk);
  }
  EXPECT_EQ(body, "321");
  EXPECT_FALSE(dispatcher.callLock().heldByCurrentThread());
}

TEST_F(DispatcherTest, ResponseHeadersAndCookiesFromArguments) {
  dispatcher.addRoute(http::Method::GET, "/prefs", Signature(), SyncHandler([](Arguments& args) -> HandlerResult {
                        args.responseHeaders().append("Cache-Control", "no-store");
                        args.deleteCookie("legacy");
                        Json body = JsonObject();
                        body["theme"] = std::string("dark");
                        return body;
                      }));
  const HttpResponse response = get("/prefs");
  EXPECT_EQ(response.headerValue("Cache-Control"), "no-store");
  ASSERT_EQ(response.cookies().size(), 1U);
  EXPECT_EQ(response.cookies()[0].maxAge, 0);
}

TEST_F(DispatcherTest, RegistrationChecks) {
  EXPECT_THROW(dispatcher.addRoute(http::Method::GET, "/a/{id}", Signature(),
                                   SyncHandler([](Arguments&) -> HandlerResult { return {}; })),
               std::invalid_argument);
  EXPECT_THROW(dispatcher.addRoute(http::Method::POST, "/mixed", Signature().body("a", Shape::AnyJson()).form("b"),
                                   SyncHandler([](Arguments&) -> HandlerResult { return {}; })),
               std::invalid_argument);
  dispatcher.addRoute(http::Method::GET, "/needs-db", Signature().depends("db"),
                      SyncHandler([](Arguments&) -> HandlerResult { return {}; }));
  EXPECT_THROW(dispatcher.freeze(), std::invalid_argument);

  dispatcher.dependencies().declare("db", {}, [](DependencyScope&) { return std::any(1); });
  dispatcher.freeze();
  EXPECT_TRUE(dispatcher.frozen());
  EXPECT_THROW(dispatcher.addRoute(http::Method::GET, "/late", Signature(),
                                   SyncHandler([](Arguments&) -> HandlerResult { return {}; })),
               std::logic_error);
  EXPECT_THROW(dispatcher.addMiddleware(MiddlewareEntry{}), std::logic_error);
}

}  // namespace ignyx
