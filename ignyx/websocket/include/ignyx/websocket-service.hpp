#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "ignyx/call-bridge.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/router-config.hpp"
#include "ignyx/router.hpp"
#include "ignyx/websocket-config.hpp"
#include "ignyx/websocket-session.hpp"

namespace ignyx {

// Handler of a WebSocket route. It usually accepts the session, then loops on receive until ConnectionClosed.
// Returning closes the connection normally (or refuses the upgrade if it was never accepted).
using WebSocketHandler = std::function<HandlerTask<void>(WebSocketSession&)>;

struct WebSocketEndpoint {
  std::string pattern;
  WebSocketHandler handler;
  std::string name;
};

using WebSocketEndpointPtr = std::shared_ptr<const WebSocketEndpoint>;

// WebSocket routes and the execution of their handlers through the call bridge.
class WebSocketService {
 public:
  using SessionOrRejection = std::variant<std::shared_ptr<WebSocketSession>, HttpResponse>;

  explicit WebSocketService(CallBridge& bridge, RouterConfig routerConfig = {},
                            websocket::WebSocketConfig config = {});

  // Throws RouteConflict, std::invalid_argument for an invalid template or an empty handler.
  void add(std::string_view pattern, WebSocketHandler handler, std::string name = {});

  [[nodiscard]] bool empty() const noexcept { return _router.size() == 0; }

  // Endpoint whose template matches the path of 'request', or nullptr. Path parameters are stored in 'request'.
  [[nodiscard]] WebSocketEndpointPtr match(HttpRequest& request) const;

  // Validates the handshake of 'request' and starts the endpoint handler on a worker thread.
  // Returns the rejection response for an invalid handshake.
  [[nodiscard]] SessionOrRejection open(const WebSocketEndpointPtr& endpoint, HttpRequest request,
                                        WebSocketSession::WakeupFn wakeup);

  [[nodiscard]] const websocket::WebSocketConfig& config() const noexcept { return _config; }

 private:
  void start(WebSocketEndpointPtr endpoint, std::shared_ptr<WebSocketSession> session);

  CallBridge& _bridge;
  Router<WebSocketEndpointPtr> _router;
  websocket::WebSocketConfig _config;
};

}  // namespace ignyx
