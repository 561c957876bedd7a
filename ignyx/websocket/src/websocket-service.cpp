#include "ignyx/websocket-service.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/call-bridge.hpp"
#include "ignyx/call-lock.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/log.hpp"
#include "ignyx/websocket-upgrade.hpp"

namespace ignyx {

namespace {

// State shared by the callbacks driving one handler task.
struct HandlerRun {
  std::shared_ptr<WebSocketSession> session;
  HandlerTask<void> task;
};

}  // namespace

WebSocketService::WebSocketService(CallBridge& bridge, RouterConfig routerConfig, websocket::WebSocketConfig config)
    : _bridge(bridge), _router(routerConfig), _config(config) {
  _config.validate();
}

void WebSocketService::add(std::string_view pattern, WebSocketHandler handler, std::string name) {
  if (!handler) {
    throw std::invalid_argument("Empty WebSocket handler");
  }
  auto endpoint =
      std::make_shared<const WebSocketEndpoint>(std::string(pattern), std::move(handler), std::move(name));
  _router.add(http::Method::GET, pattern, std::move(endpoint));
  log::debug("WebSocket route {} registered", pattern);
}

WebSocketEndpointPtr WebSocketService::match(HttpRequest& request) const {
  auto routeMatch = _router.match(http::Method::GET, request.rawPath());
  if (routeMatch.kind != Router<WebSocketEndpointPtr>::Match::Kind::Matched) {
    return nullptr;
  }
  request.setPathParams(std::move(routeMatch.pathParams));
  return *routeMatch.target;
}

WebSocketService::SessionOrRejection WebSocketService::open(const WebSocketEndpointPtr& endpoint, HttpRequest request,
                                                            WebSocketSession::WakeupFn wakeup) {
  UpgradeValidationResult handshake = ValidateWebSocketUpgrade(request);
  if (!handshake.valid) {
    log::debug("WebSocket handshake for {} refused: {}", request.path(), handshake.errorMessage);
    return BuildWebSocketUpgradeRejection(request, handshake);
  }
  auto session =
      std::make_shared<WebSocketSession>(std::move(request), std::move(handshake), _config, std::move(wakeup));
  start(endpoint, session);
  return session;
}

void WebSocketService::start(WebSocketEndpointPtr endpoint, std::shared_ptr<WebSocketSession> session) {
  auto run = std::make_shared<HandlerRun>();
  run->session = std::move(session);

  const bool posted = _bridge.workers().post([&bridge = _bridge, endpoint = std::move(endpoint), run] {
    std::optional<CallLock::Guard> guard;
    try {
      guard.emplace(bridge.acquire());
    } catch (const LockTimeout&) {
      run->session->finish(std::current_exception());
      return;
    }
    try {
      run->task = endpoint->handler(*run->session);
    } catch (...) {
      run->session->finish(CaptureUserException());
      return;
    }
    if (!run->task.valid()) {
      run->session->finish(std::make_exception_ptr(std::logic_error("WebSocket handler returned an empty task")));
      return;
    }

    TaskDriver::Callbacks callbacks;
    callbacks.onCompleted = [run] {
      std::exception_ptr error;
      try {
        run->task.result();
      } catch (...) {
        error = CaptureUserException();
      }
      run->task.reset();
      run->session->finish(error);
    };
    callbacks.onAbandoned = [run](std::exception_ptr error) {
      if (!error) {
        error = std::make_exception_ptr(ConnectionClosed(1001, "Server shutting down"));
      }
      run->session->finish(error);
    };
    callbacks.onReleased = [run] { run->task.reset(); };
    // A closed connection is reported to the handler by receive and send, it is never cancelled.
    bridge.drive(run->task.handle(), std::move(callbacks), std::move(*guard));
  });
  if (!posted) {
    run->session->goingAway();
  }
}

}  // namespace ignyx
