#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "ignyx/app.hpp"
#include "ignyx/event-fd.hpp"
#include "ignyx/event-loop.hpp"
#include "ignyx/flat-hash-map.hpp"
#include "ignyx/http-request-parser.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/request-context.hpp"
#include "ignyx/server-config.hpp"
#include "ignyx/socket.hpp"
#include "ignyx/timedef.hpp"
#include "ignyx/vector.hpp"
#include "ignyx/websocket-session.hpp"

namespace ignyx {

class Reactor;

// Jobs posted to a reactor by other threads (response completions, streamed chunks, WebSocket wakeups).
// Shared with the posted callbacks, which may outlive the reactor: posting to a closed mailbox fails.
class Mailbox {
 public:
  using Job = std::move_only_function<void(Reactor&)>;

  // Returns false if the reactor is gone.
  bool post(Job job);

  // Jobs queued so far.
  std::deque<Job> take();

  // Refuses further posts. Returns the jobs that were never run.
  std::deque<Job> close();

  [[nodiscard]] const EventFd& wakeupFd() const noexcept { return _wakeupFd; }

 private:
  std::mutex _mutex;
  std::deque<Job> _jobs;
  EventFd _wakeupFd;
  bool _closed{false};
};

// State of one client connection, owned by its reactor.
struct Connection {
  Socket socket;
  // Distinguishes successive connections reusing the same file descriptor.
  uint64_t id{};
  std::string inBuffer;
  std::string outBuffer;
  std::size_t outOffset{};
  SteadyTimePoint lastActivity;
  uint32_t nbRequests{};

  // Request in flight (one at a time, pipelined requests wait in 'inBuffer').
  std::shared_ptr<RequestContext> context;
  bool responseReceived{false};
  bool responseQueued{false};
  bool headRequest{false};
  bool keepAlive{true};
  bool continueSent{false};

  // Streamed body being pulled on worker threads.
  std::shared_ptr<HttpResponse::ChunkSource> chunkSource;
  bool pullingChunk{false};

  std::shared_ptr<WebSocketSession> session;
  bool readPaused{false};

  bool peerClosed{false};
  bool closeAfterWrite{false};
  bool writeInterest{false};
  bool closed{false};

  [[nodiscard]] std::size_t pendingOutput() const noexcept { return outBuffer.size() - outOffset; }
};

// One event loop with its own listening socket. Connections are served entirely by the reactor that accepted
// them, requests are executed by the application worker pool and come back through the mailbox.
class Reactor {
 public:
  // Binds the listening socket. A 0 'port' is replaced by the ephemeral port picked by the OS.
  Reactor(App& app, const ServerConfig& config, bool reusePort, uint16_t& port);

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;

  ~Reactor();

  // Serves connections until requestStop() or a termination signal, then closes all connections.
  void run();

  // Thread safe.
  void requestStop() noexcept;

  // Clears a previous stop request, before running again.
  void rearm() noexcept;

  [[nodiscard]] std::size_t nbConnections() const noexcept { return _connections.size(); }

 private:
  void eventLoop();
  void acceptNewConnections();
  void processMailbox();
  void maintenance(SteadyTimePoint now);
  void closeAllConnections();
  void eraseClosedConnections();

  Connection* findConnection(int fd, uint64_t id);

  void handleReadable(Connection& cnx);
  void handleWritable(Connection& cnx);
  void processInput(Connection& cnx);
  void startWebSocket(Connection& cnx, const WebSocketEndpointPtr& endpoint, HttpRequest request);
  void dispatchRequest(Connection& cnx, HttpRequest request);

  void onResponse(Connection& cnx, HttpResponse response);
  void pullNextChunk(Connection& cnx);
  void onChunk(Connection& cnx, std::optional<std::string> chunk, bool failed);
  void onResponseQueued(Connection& cnx);
  void drainSession(Connection& cnx);

  void queueSimpleError(Connection& cnx, http::StatusCode status);
  // Writes as much pending output as the socket accepts, then moves the connection forward.
  void flush(Connection& cnx);
  void updateWriteInterest(Connection& cnx, bool enable);
  void closeConnection(Connection& cnx);

  App& _app;
  const ServerConfig& _config;
  HttpRequestParser _parser;
  EventLoop _eventLoop;
  Socket _listenSocket;
  std::shared_ptr<Mailbox> _mailbox;
  flat_hash_map<int, std::unique_ptr<Connection>> _connections;
  vector<int> _closedFds;
  uint64_t _nextConnectionId{1};
  SteadyTimePoint _lastMaintenance;
  std::atomic<bool> _stopRequested{false};
};

}  // namespace ignyx
