#include "reactor.hpp"

#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "ignyx/base-fd.hpp"
#include "ignyx/event.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/log.hpp"
#include "ignyx/signal-handler.hpp"
#include "ignyx/socket-ops.hpp"
#include "ignyx/websocket-service.hpp"

namespace ignyx {

namespace {

constexpr EventBmp kClientEvents = EventIn | EventRdHup | EventEt;
constexpr std::size_t kReadChunkSize = 16UL * 1024UL;
constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

}  // namespace

bool Mailbox::post(Job job) {
  {
    std::lock_guard lock(_mutex);
    if (_closed) {
      return false;
    }
    _jobs.push_back(std::move(job));
  }
  _wakeupFd.send();
  return true;
}

std::deque<Mailbox::Job> Mailbox::take() {
  std::lock_guard lock(_mutex);
  return std::exchange(_jobs, {});
}

std::deque<Mailbox::Job> Mailbox::close() {
  std::lock_guard lock(_mutex);
  _closed = true;
  return std::exchange(_jobs, {});
}

Reactor::Reactor(App& app, const ServerConfig& config, bool reusePort, uint16_t& port)
    : _app(app),
      _config(config),
      _parser(ParserLimits{config.maxHeaderBytes, config.maxBodyBytes}),
      _eventLoop(config.pollInterval),
      _listenSocket(Socket::Type::StreamNonBlock),
      _mailbox(std::make_shared<Mailbox>()),
      _lastMaintenance(SteadyClock::now()) {
  _listenSocket.bindAndListen(reusePort, port, SOMAXCONN);
  _eventLoop.addOrThrow(_listenSocket.fd(), EventIn);
  _eventLoop.addOrThrow(_mailbox->wakeupFd().fd(), EventIn);
}

Reactor::~Reactor() {
  closeAllConnections();
  // Completions that never made it: their connections are gone, which finalizes the requests as not sent.
  for (auto& job : _mailbox->close()) {
    job(*this);
  }
}

void Reactor::requestStop() noexcept {
  _stopRequested.store(true, std::memory_order_relaxed);
  _mailbox->wakeupFd().send();
}

void Reactor::rearm() noexcept { _stopRequested.store(false, std::memory_order_relaxed); }

void Reactor::run() {
  while (!_stopRequested.load(std::memory_order_relaxed)) {
    eventLoop();
  }
  closeAllConnections();
}

void Reactor::eventLoop() {
  for (const EventLoop::Event event : _eventLoop.poll()) {
    const int fd = event.fd;
    if (fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else if (fd == _mailbox->wakeupFd().fd()) {
      processMailbox();
    } else {
      auto it = _connections.find(fd);
      if (it == _connections.end() || it->second->closed) {
        continue;
      }
      Connection& cnx = *it->second;
      const auto bmp = event.eventBmp;
      if ((bmp & EventOut) != 0) {
        handleWritable(cnx);
      }
      if (cnx.readPaused && (bmp & (EventErr | EventHup)) != 0) {
        closeConnection(cnx);
        continue;
      }
      // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN: reading observes EOF or the error.
      if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
        handleReadable(cnx);
      }
    }
  }

  const auto now = SteadyClock::now();
  if (now >= _lastMaintenance + _config.pollInterval) {
    _lastMaintenance = now;
    maintenance(now);
  }
  eraseClosedConnections();
}

void Reactor::acceptNewConnections() {
  while (true) {
    BaseFd clientFd = AcceptNonBlocking(_listenSocket.fd());
    if (!clientFd) {
      break;
    }
    const int fd = clientFd.fd();
    if (!SetTcpNoDelay(fd)) {
      log::debug("Unable to set TCP_NODELAY on fd # {}", fd);
    }
    if (!_eventLoop.add(fd, kClientEvents)) {
      continue;
    }
    auto cnx = std::make_unique<Connection>();
    cnx->socket = Socket(std::move(clientFd));
    cnx->id = _nextConnectionId++;
    cnx->lastActivity = SteadyClock::now();
    _connections.insert_or_assign(fd, std::move(cnx));
    log::debug("Connection fd # {} accepted", fd);
  }
}

void Reactor::processMailbox() {
  _mailbox->wakeupFd().read();
  for (auto& job : _mailbox->take()) {
    job(*this);
  }
}

Connection* Reactor::findConnection(int fd, uint64_t id) {
  auto it = _connections.find(fd);
  if (it == _connections.end() || it->second->id != id || it->second->closed) {
    return nullptr;
  }
  return it->second.get();
}

void Reactor::maintenance(SteadyTimePoint now) {
  for (auto& [fd, cnxPtr] : _connections) {
    Connection& cnx = *cnxPtr;
    if (cnx.closed) {
      continue;
    }
    if (cnx.session) {
      if (cnx.session->checkCloseTimeout(now)) {
        drainSession(cnx);
      }
      continue;
    }
    if (!cnx.context && cnx.pendingOutput() == 0 && _config.keepAliveTimeout.count() > 0 &&
        now > cnx.lastActivity + _config.keepAliveTimeout) {
      log::debug("Closing idle connection fd # {}", fd);
      closeConnection(cnx);
    }
  }
  if (SignalHandler::IsStopRequested()) {
    _stopRequested.store(true, std::memory_order_relaxed);
  }
}

void Reactor::closeAllConnections() {
  for (auto& [fd, cnxPtr] : _connections) {
    Connection& cnx = *cnxPtr;
    if (!cnx.closed && cnx.session) {
      // Best effort: the Close frame goes out if the socket accepts it right away.
      cnx.session->goingAway();
      drainSession(cnx);
    }
  }
  for (auto& [fd, cnxPtr] : _connections) {
    closeConnection(*cnxPtr);
  }
  eraseClosedConnections();
}

void Reactor::eraseClosedConnections() {
  for (int fd : _closedFds) {
    _connections.erase(fd);
  }
  _closedFds.clear();
}

void Reactor::handleReadable(Connection& cnx) {
  if (cnx.closed || cnx.readPaused) {
    return;
  }
  std::array<char, kReadChunkSize> buf;
  while (true) {
    const int64_t nbRead = SafeRecv(cnx.socket.fd(), buf.data(), buf.size());
    if (nbRead > 0) {
      cnx.lastActivity = SteadyClock::now();
      const std::string_view data(buf.data(), static_cast<std::size_t>(nbRead));
      if (cnx.session) {
        cnx.session->onInput(std::as_bytes(std::span<const char>(data.data(), data.size())));
      } else {
        cnx.inBuffer.append(data);
      }
      continue;
    }
    if (nbRead == 0) {
      cnx.peerClosed = true;
      break;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    }
    log::debug("recv error on fd # {}: {}", cnx.socket.fd(), std::strerror(errno));
    closeConnection(cnx);
    return;
  }

  if (cnx.session) {
    if (cnx.peerClosed) {
      closeConnection(cnx);
    } else {
      drainSession(cnx);
    }
    return;
  }
  processInput(cnx);
  if (!cnx.closed && cnx.peerClosed && !cnx.context && cnx.pendingOutput() == 0) {
    closeConnection(cnx);
  }
}

void Reactor::handleWritable(Connection& cnx) {
  flush(cnx);
  if (!cnx.closed && cnx.chunkSource) {
    pullNextChunk(cnx);
  }
  if (!cnx.closed && cnx.session && cnx.readPaused) {
    drainSession(cnx);
  }
}

void Reactor::processInput(Connection& cnx) {
  while (!cnx.closed && !cnx.context && !cnx.session && !cnx.closeAfterWrite && !cnx.inBuffer.empty()) {
    HttpRequest request;
    const ParseOutcome outcome = _parser.parse(cnx.inBuffer, request);
    switch (outcome.status) {
      case ParseOutcome::Status::NeedMore:
        if (outcome.headComplete && outcome.expectContinue && !cnx.continueSent) {
          cnx.continueSent = true;
          cnx.outBuffer.append(kContinueResponse);
          flush(cnx);
        }
        return;
      case ParseOutcome::Status::Error:
        log::debug("Invalid request on fd # {}, answering {}", cnx.socket.fd(), outcome.errorStatus);
        queueSimpleError(cnx, outcome.errorStatus);
        return;
      default:
        break;
    }
    cnx.inBuffer.erase(0, outcome.consumed);
    cnx.continueSent = false;
    ++cnx.nbRequests;
    if (request.isWebSocketUpgrade()) {
      if (WebSocketEndpointPtr endpoint = _app.websockets().match(request)) {
        startWebSocket(cnx, endpoint, std::move(request));
        return;
      }
    }
    dispatchRequest(cnx, std::move(request));
  }
}

void Reactor::dispatchRequest(Connection& cnx, HttpRequest request) {
  cnx.headRequest = request.method() == http::Method::HEAD;
  cnx.keepAlive = _config.enableKeepAlive && request.wantsKeepAlive() &&
                  cnx.nbRequests < _config.maxRequestsPerConnection;
  cnx.responseReceived = false;
  cnx.responseQueued = false;

  auto context = std::make_shared<RequestContext>(std::move(request));
  cnx.context = context;

  Dispatcher& dispatcher = _app.dispatcher();
  dispatcher.dispatch(context, [mailbox = _mailbox, &dispatcher, fd = cnx.socket.fd(), id = cnx.id,
                                context](HttpResponse response) {
    const bool posted = mailbox->post([fd, id, context, response = std::move(response)](Reactor& reactor) mutable {
      Connection* cnx = reactor.findConnection(fd, id);
      if (cnx == nullptr || cnx->context != context) {
        reactor._app.dispatcher().finalize(context, false);
        return;
      }
      reactor.onResponse(*cnx, std::move(response));
    });
    if (!posted) {
      dispatcher.finalize(context, false);
    }
  });
}

void Reactor::startWebSocket(Connection& cnx, const WebSocketEndpointPtr& endpoint, HttpRequest request) {
  auto wakeup = [mailbox = _mailbox, fd = cnx.socket.fd(), id = cnx.id] {
    const bool posted = mailbox->post([fd, id](Reactor& reactor) {
      if (Connection* cnx = reactor.findConnection(fd, id)) {
        reactor.drainSession(*cnx);
      }
    });
    if (!posted) {
      log::trace("WebSocket wakeup for fd # {} dropped, server is stopped", fd);
    }
  };

  auto sessionOrRejection = _app.websockets().open(endpoint, std::move(request), std::move(wakeup));
  if (auto* rejection = std::get_if<HttpResponse>(&sessionOrRejection)) {
    cnx.outBuffer.append(rejection->serialize({false, false, _app.config().serverName}));
    cnx.closeAfterWrite = true;
    flush(cnx);
    return;
  }

  cnx.session = std::get<std::shared_ptr<WebSocketSession>>(std::move(sessionOrRejection));
  log::debug("WebSocket session started on fd # {} for {}", cnx.socket.fd(), cnx.session->request().path());
  if (!cnx.inBuffer.empty()) {
    cnx.session->onInput(std::as_bytes(std::span<const char>(cnx.inBuffer.data(), cnx.inBuffer.size())));
    cnx.inBuffer.clear();
  }
  drainSession(cnx);
}

void Reactor::onResponse(Connection& cnx, HttpResponse response) {
  cnx.responseReceived = true;
  const HttpResponse::WireOptions options{cnx.headRequest, cnx.keepAlive && !cnx.peerClosed,
                                          _app.config().serverName};
  if (!options.keepAlive) {
    cnx.keepAlive = false;
  }
  if (!response.isStreaming()) {
    cnx.outBuffer.append(response.serialize(options));
    onResponseQueued(cnx);
    return;
  }

  // The head must be serialized while the source is still attached, it announces chunked coding.
  cnx.outBuffer.append(response.serializeHead(options));
  if (cnx.headRequest) {
    onResponseQueued(cnx);
    return;
  }
  cnx.chunkSource = std::make_shared<HttpResponse::ChunkSource>(response.takeChunkSource());
  flush(cnx);
  if (!cnx.closed) {
    pullNextChunk(cnx);
  }
}

void Reactor::pullNextChunk(Connection& cnx) {
  if (cnx.closed || cnx.pullingChunk || !cnx.chunkSource) {
    return;
  }
  if (cnx.pendingOutput() >= _config.maxOutboundBufferBytes) {
    // Resumed by handleWritable once the socket drained.
    return;
  }
  cnx.pullingChunk = true;
  Dispatcher& dispatcher = _app.dispatcher();
  const bool posted = dispatcher.post([mailbox = _mailbox, &dispatcher, fd = cnx.socket.fd(), id = cnx.id,
                                       source = cnx.chunkSource, context = cnx.context] {
    std::optional<std::string> chunk;
    bool failed = false;
    try {
      chunk = (*source)();
    } catch (const std::exception& ex) {
      log::error("Streaming body source failed: {}", ex.what());
      failed = true;
    }
    // A connection closed during the pull hands the request over: teardowns run after the source returned.
    const bool delivered =
        mailbox->post([fd, id, context, chunk = std::move(chunk), failed](Reactor& reactor) mutable {
          if (Connection* cnx = reactor.findConnection(fd, id)) {
            reactor.onChunk(*cnx, std::move(chunk), failed);
          } else {
            reactor._app.dispatcher().finalize(std::move(context), false);
          }
        });
    if (!delivered) {
      log::debug("Streamed chunk for fd # {} dropped, server is stopped", fd);
      dispatcher.finalize(context, false);
    }
  });
  if (!posted) {
    onChunk(cnx, std::nullopt, true);
  }
}

void Reactor::onChunk(Connection& cnx, std::optional<std::string> chunk, bool failed) {
  cnx.pullingChunk = false;
  if (failed) {
    // The head is already out: the only way to signal the failure is to cut the body short.
    closeConnection(cnx);
    return;
  }
  if (!chunk) {
    cnx.chunkSource.reset();
    cnx.outBuffer.append(HttpResponse::EncodeChunk({}));
    onResponseQueued(cnx);
    return;
  }
  if (!chunk->empty()) {
    cnx.outBuffer.append(HttpResponse::EncodeChunk(*chunk));
  }
  flush(cnx);
  pullNextChunk(cnx);
}

void Reactor::onResponseQueued(Connection& cnx) {
  cnx.responseQueued = true;
  if (!cnx.keepAlive) {
    cnx.closeAfterWrite = true;
  }
  flush(cnx);
}

void Reactor::drainSession(Connection& cnx) {
  if (cnx.closed) {
    return;
  }
  WebSocketSession::Drained drained = cnx.session->drain();
  cnx.outBuffer.append(drained.output);
  if (drained.closeTransport) {
    cnx.closeAfterWrite = true;
  }
  flush(cnx);
  if (cnx.closed) {
    return;
  }
  const bool pause = drained.pauseReading || cnx.pendingOutput() >= _config.maxOutboundBufferBytes;
  if (cnx.readPaused && !pause) {
    cnx.readPaused = false;
    // Edge triggered: bytes that arrived while paused did not raise a new event.
    handleReadable(cnx);
  } else {
    cnx.readPaused = pause;
  }
}

void Reactor::queueSimpleError(Connection& cnx, http::StatusCode status) {
  HttpResponse response = HttpResponse::PlainText(std::string(http::ReasonPhraseFor(status)), status);
  cnx.outBuffer.append(response.serialize({false, false, _app.config().serverName}));
  cnx.inBuffer.clear();
  cnx.closeAfterWrite = true;
  flush(cnx);
}

void Reactor::flush(Connection& cnx) {
  if (cnx.closed) {
    return;
  }
  while (cnx.pendingOutput() != 0) {
    const int64_t nbSent =
        SafeSend(cnx.socket.fd(), cnx.outBuffer.data() + cnx.outOffset, cnx.pendingOutput());
    if (nbSent < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        updateWriteInterest(cnx, true);
        return;
      }
      log::debug("send error on fd # {}: {}", cnx.socket.fd(), std::strerror(errno));
      closeConnection(cnx);
      return;
    }
    cnx.outOffset += static_cast<std::size_t>(nbSent);
    cnx.lastActivity = SteadyClock::now();
  }
  cnx.outBuffer.clear();
  cnx.outOffset = 0;
  updateWriteInterest(cnx, false);
  if (cnx.closed) {
    return;
  }

  if (cnx.responseQueued) {
    // The whole response is written: background tasks may run.
    cnx.responseQueued = false;
    cnx.responseReceived = false;
    _app.dispatcher().finalize(std::move(cnx.context), true);
    cnx.context.reset();
    if (cnx.closeAfterWrite) {
      closeConnection(cnx);
      return;
    }
    processInput(cnx);
    if (!cnx.closed && cnx.peerClosed && !cnx.context) {
      closeConnection(cnx);
    }
    return;
  }
  if (cnx.closeAfterWrite && !cnx.context && !cnx.chunkSource) {
    closeConnection(cnx);
  }
}

void Reactor::updateWriteInterest(Connection& cnx, bool enable) {
  if (cnx.writeInterest == enable) {
    return;
  }
  if (!_eventLoop.mod(cnx.socket.fd(), enable ? (kClientEvents | EventOut) : kClientEvents)) {
    closeConnection(cnx);
    return;
  }
  cnx.writeInterest = enable;
}

void Reactor::closeConnection(Connection& cnx) {
  if (cnx.closed) {
    return;
  }
  cnx.closed = true;
  const int fd = cnx.socket.fd();
  _eventLoop.del(fd);
  if (cnx.context) {
    cnx.context->cancel();
    // Without a response yet, the completion finalizes the request when it finds the connection gone. A chunk
    // pull in flight does the same once the source returned.
    if (cnx.responseReceived && !cnx.pullingChunk) {
      _app.dispatcher().finalize(std::move(cnx.context), false);
    }
    cnx.context.reset();
  }
  cnx.chunkSource.reset();
  if (cnx.session) {
    cnx.session->onTransportClosed();
  }
  // The descriptor stays open until erased so that it cannot be reused by an accept of the same iteration.
  _closedFds.push_back(fd);
  log::debug("Connection fd # {} closed", fd);
}

}  // namespace ignyx
