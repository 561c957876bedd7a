#include <any>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "ignyx/app.hpp"
#include "ignyx/arguments.hpp"
#include "ignyx/background-tasks.hpp"
#include "ignyx/dependency.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/handler-descriptor.hpp"
#include "ignyx/handler-result.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-server.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/log.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/route-group.hpp"
#include "ignyx/server-config.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/signal-handler.hpp"
#include "ignyx/signature.hpp"
#include "ignyx/suspension.hpp"
#include "ignyx/vector.hpp"
#include "ignyx/websocket-session.hpp"

using namespace ignyx;

namespace {

Shape NewItemShape() {
  vector<Shape::Field> fields;
  fields.push_back(Shape::Field{"name", Shape::String(), true, {}});
  fields.push_back(Shape::Field{"price", Shape::Float(), true, {}});
  return Shape::Object(std::move(fields));
}

RouteGroup ItemsRoutes() {
  RouteGroup items("/items");

  items.get("/{id}", Signature().path("id", Shape::Integer()).depends("store"),
            SyncHandler([](Arguments& args) -> HandlerResult {
              auto& store = *args.dependency<vector<Json>*>("store");
              const int64_t id = args.get<int64_t>("id");
              if (id < 0 || static_cast<std::size_t>(id) >= store.size()) {
                throw HttpException(http::StatusCodeNotFound, "Item not found");
              }
              return store[static_cast<std::size_t>(id)];
            }));

  items.post("", Signature().body("item", NewItemShape()).depends("store").backgroundTasks(),
             SyncHandler([](Arguments& args) -> HandlerResult {
               auto& store = *args.dependency<vector<Json>*>("store");
               store.push_back(args.get<Json>("item"));
               const auto id = store.size() - 1;
               args.backgroundTasks().add([id] { log::info("Item {} stored", id); });
               Json created = JsonObject();
               created["id"] = static_cast<double>(id);
               return created;
             }));

  return items;
}

}  // namespace

int main(int argc, char** argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  try {
    // Handlers run one at a time under the call-lock, so the store needs no synchronization.
    vector<Json> store;

    App app;
    app.dependency("store", [&store](DependencyScope&) -> std::any { return &store; });

    app.onStartup([] { log::info("Opening the item store"); });
    app.onShutdown([&store] { log::info("Closing the item store with {} item(s)", store.size()); });

    app.middleware("access-log", [](HttpRequest& req) {
      log::info("{} {}", http::MethodToStr(req.method()), req.path());
      return MiddlewareResult::Continue();
    });

    app.get("/", SyncHandler([](Arguments&) -> HandlerResult { return "Hello from ignyx!\n"; }));

    app.get("/slow", Signature().query("ms", Shape::Integer(), Json(100.0)),
            AsyncHandler([](Arguments& args) -> HandlerTask<HandlerResult> {
              // Other requests are served while this one sleeps.
              co_await SleepFor(std::chrono::milliseconds{args.get<int64_t>("ms")});
              co_return "done\n";
            }));

    app.includeRouter(ItemsRoutes(), "/api");

    app.websocket("/ws", [](WebSocketSession& session) -> HandlerTask<void> {
      session.accept();
      while (true) {
        WebSocketMessage message = co_await session.receive();
        session.sendText("echo: " + message.data);
      }
    });

    HttpServer server(app, ServerConfig{}.withPort(port));
    server.run();  // blocking run, until Ctrl+C
  } catch (const std::exception& ex) {
    std::cerr << "Server encountered error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
