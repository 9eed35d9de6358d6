#include "tern/internal/worker.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>

#include "tern/error-kind.hpp"
#include "tern/error-response.hpp"
#include "tern/event-loop.hpp"
#include "tern/http-method.hpp"
#include "tern/http-request.hpp"
#include "tern/http-response.hpp"
#include "tern/http-server-config.hpp"
#include "tern/internal/connection-limiter.hpp"
#include "tern/internal/connection.hpp"
#include "tern/internal/handler-executor.hpp"
#include "tern/internal/stats-counters.hpp"
#include "tern/log.hpp"
#include "tern/path-params.hpp"
#include "tern/response-serializer.hpp"
#include "tern/router.hpp"
#include "tern/socket-ops.hpp"
#include "tern/socket.hpp"
#include "tern/timedef.hpp"
#include "tern/wire-reader.hpp"
#include "tern/wire-writer.hpp"

namespace tern::internal {

Worker::Worker(uint32_t workerId, const HttpServerConfig& config, const Router& router, HandlerExecutor& executor,
               StatsCounters& stats, std::stop_token requestStopToken)
    : _workerId(workerId),
      _config(config),
      _router(router),
      _executor(executor),
      _stats(stats),
      _requestStopToken(std::move(requestStopToken)),
      _eventLoop(config.pollInterval),
      _lastSweep(SteadyClock::now()) {
  _eventLoop.addOrThrow(_wakeFd.fd(), EventIn);
}

Worker::~Worker() { stop(); }

void Worker::start() {
  _thread = std::jthread([this](const std::stop_token& stopToken) { run(stopToken); });
}

void Worker::post(Socket socket, ConnectionPermit permit, std::string peer) {
  {
    std::lock_guard<std::mutex> lock(_inboxMutex);
    _pendingConnections.push_back(PendingConnection{std::move(socket), std::move(permit), std::move(peer)});
  }
  _wakeFd.notify();
}

void Worker::postCompletion(HandlerCompletion completion) {
  {
    std::lock_guard<std::mutex> lock(_inboxMutex);
    _completions.push_back(std::move(completion));
  }
  _wakeFd.notify();
}

void Worker::beginDrain() {
  _draining.store(true, std::memory_order_relaxed);
  _wakeFd.notify();
}

void Worker::stop() {
  if (_thread.joinable()) {
    _thread.request_stop();
    _thread.join();
  }
}

void Worker::run(const std::stop_token& stopToken) {
  std::stop_callback wakeOnStop(stopToken, [this] { _wakeFd.notify(); });

  log::debug("Worker {} started", _workerId);
  while (!stopToken.stop_requested()) {
    const auto events = _eventLoop.poll();
    if (events.data() == nullptr) {
      log::error("Worker {} stops on unrecoverable poll failure, closing {} connections", _workerId,
                 _connections.size());
      break;
    }
    for (const ReadyEvent& event : events) {
      if (event.fd == _wakeFd.fd()) {
        _wakeFd.drain();
      } else {
        handleEvent(event.fd, event.eventBmp);
      }
    }
    processInbox();
    if (isDraining() && !_drainApplied) {
      applyDrain();
    }
    sweepTimeouts(SteadyClock::now());
    reapClosed();
  }

  // Remaining connections are closed without any response, their permits are released.
  log::debug("Worker {} stopping, dropping {} connections", _workerId, _connections.size());
  _connections.clear();
  std::lock_guard<std::mutex> lock(_inboxMutex);
  _pendingConnections.clear();
  _completions.clear();
}

void Worker::processInbox() {
  vector<PendingConnection> pendingConnections;
  vector<HandlerCompletion> completions;
  {
    std::lock_guard<std::mutex> lock(_inboxMutex);
    pendingConnections.swap(_pendingConnections);
    completions.swap(_completions);
  }
  for (PendingConnection& pending : pendingConnections) {
    acceptConnection(std::move(pending));
  }
  for (HandlerCompletion& completion : completions) {
    handleCompletion(completion);
  }
}

void Worker::acceptConnection(PendingConnection pending) {
  const int fd = pending.socket.fd();
  if (isDraining()) {
    log::debug("Closing connection fd # {} from {} accepted during shutdown", fd, pending.peer);
    return;
  }
  if (_config.tcpNoDelay && !SetTcpNoDelay(fd)) {
    log::warn("Failed to set TCP_NODELAY on fd # {}", fd);
  }
  if (!_eventLoop.add(fd, EventIn)) {
    return;
  }
  auto conn = std::make_unique<Connection>(std::move(pending.socket), std::move(pending.permit),
                                           std::move(pending.peer), _nextConnectionId++, _config, _requestStopToken,
                                           SteadyClock::now());
  log::debug("Worker {} accepted connection # {} fd # {} from {}", _workerId, conn->id, fd, conn->peer);
  _connections.insert_or_assign(fd, std::move(conn));
}

void Worker::handleEvent(int fd, EventBmp eventBmp) {
  auto it = _connections.find(fd);
  if (it == _connections.end() || it->second->closed) {
    return;
  }
  Connection& conn = *it->second;
  if ((eventBmp & (EventErr | EventHup)) != 0) {
    if (conn.state != ConnectionState::Closing) {
      log::debug("Connection # {} from {} reset by peer while {}", conn.id, conn.peer,
                 ConnectionStateToStr(conn.state));
    }
    closeConnection(conn);
    return;
  }
  if ((eventBmp & EventIn) != 0) {
    onReadable(conn);
  }
  if ((eventBmp & EventOut) != 0 && !conn.closed && conn.state == ConnectionState::Writing) {
    onWritable(conn);
  }
}

void Worker::onReadable(Connection& conn) {
  switch (conn.state) {
    case ConnectionState::Closing: {
      // Lingering: discard late client bytes until EOF.
      const FillResult fillResult = conn.reader.fill(conn.fd());
      conn.reader.discardBuffered();
      if (fillResult.status == IoStatus::PeerClosed || fillResult.status == IoStatus::Error) {
        closeConnection(conn);
      }
      return;
    }
    case ConnectionState::Handling:
      [[fallthrough]];
    case ConnectionState::Writing:
      return;
    default:
      break;
  }

  const FillResult fillResult = conn.reader.fill(conn.fd());
  if (fillResult.nbBytes != 0) {
    const auto now = SteadyClock::now();
    conn.lastReadTime = now;
    if (conn.state == ConnectionState::Idle) {
      conn.state = ConnectionState::Reading;
      conn.requestStartTime = now;
    }
  }
  switch (fillResult.status) {
    case IoStatus::Error:
      closeConnection(conn);
      return;
    case IoStatus::PeerClosed:
      conn.peerClosed = true;
      break;
    default:
      break;
  }

  processBuffered(conn);

  if (!conn.closed && conn.peerClosed) {
    if (conn.state == ConnectionState::Reading) {
      log::warn("Peer {} closed connection # {} in the middle of a request", conn.peer, conn.id);
      closeConnection(conn);
    } else if (conn.state == ConnectionState::Idle) {
      if (conn.nbRequestsServed == 0) {
        log::debug("Connection # {} from {} closed without sending a byte", conn.id, conn.peer);
      } else {
        log::debug("Connection # {} from {} closed by peer", conn.id, conn.peer);
      }
      closeConnection(conn);
    }
  }
}

void Worker::onWritable(Connection& conn) {
  flushResponse(conn);
  processBuffered(conn);
}

void Worker::processBuffered(Connection& conn) {
  while (!conn.closed && (conn.state == ConnectionState::Idle || conn.state == ConnectionState::Reading)) {
    if (conn.reader.bufferedBytes() == 0 && !conn.reader.waitingForBody()) {
      conn.state = ConnectionState::Idle;
      break;
    }
    if (conn.state == ConnectionState::Idle) {
      conn.state = ConnectionState::Reading;
      conn.requestStartTime = SteadyClock::now();
    }

    const FrameResult frameResult = conn.reader.next(*conn.request);
    switch (frameResult.status) {
      case FrameResult::Status::NeedMore:
        updateInterest(conn);
        return;
      case FrameResult::Status::Error: {
        const http::ErrorKind kind = frameResult.error;
        StatsCounters::Increment(_stats.parseErrors);
        log::warn("Invalid request from {}: {} ({})", conn.peer, http::ErrorKindToStr(kind),
                  http::FailureClassToStr(http::FailureClassOf(kind)));
        const bool forceClose = ClosesConnection(kind) || !conn.request->keepAlive();
        conn.headRequest = false;
        conn.resetRequest();
        if (forceClose) {
          conn.reader.discardBuffered();
        }
        sendResponse(conn, ErrorResponseFor(kind), forceClose);
        break;
      }
      default:
        dispatchRequest(conn);
        break;
    }
  }
}

void Worker::dispatchRequest(Connection& conn) {
  std::shared_ptr<HttpRequest> request = std::move(conn.request);
  conn.resetRequest();
  conn.headRequest = request->method() == http::Method::HEAD;
  const bool clientWantsClose = !request->keepAlive();

  RoutingResult routingResult = _router.match(request->method(), request->path());
  switch (routingResult.outcome) {
    case RoutingResult::Outcome::NotFound:
      sendResponse(conn, ErrorResponseFor(http::ErrorKind::NotFound), clientWantsClose);
      return;
    case RoutingResult::Outcome::MethodNotAllowed:
      sendResponse(conn, MethodNotAllowedResponse(routingResult.allowedMethods), clientWantsClose);
      return;
    default:
      break;
  }

  conn.state = ConnectionState::Handling;
  conn.handlerStartTime = SteadyClock::now();
  conn.closeAfterWrite = clientWantsClose;
  const uint64_t requestSeq = ++conn.requestSeq;
  updateInterest(conn);
  if (conn.closed) {
    return;
  }

  HandlerCompletion completion{conn.fd(), conn.id, requestSeq, HttpResponse{}, false};
  try {
    _executor.submit([this, handler = routingResult.handler, request = std::move(request),
                      pathParams = std::move(routingResult.pathParams), completion = std::move(completion)]() mutable {
      try {
        completion.response = (*handler)(*request, pathParams);
      } catch (const std::exception& ex) {
        log::error("Handler for {} {} threw: {}, answering {}", request->methodStr(), request->target(), ex.what(),
                   StatusCodeFor(http::ErrorKind::HandlerFailure));
        completion.response = ErrorResponseFor(http::ErrorKind::HandlerFailure);
        completion.failed = true;
      } catch (...) {
        log::error("Handler for {} {} threw an unknown exception, answering {}", request->methodStr(),
                   request->target(), StatusCodeFor(http::ErrorKind::HandlerFailure));
        completion.response = ErrorResponseFor(http::ErrorKind::HandlerFailure);
        completion.failed = true;
      }
      postCompletion(std::move(completion));
    });
  } catch (const std::runtime_error& ex) {
    log::error("Cannot run handler for connection # {}: {}", conn.id, ex.what());
    closeConnection(conn);
  }
}

void Worker::handleCompletion(HandlerCompletion& completion) {
  auto it = _connections.find(completion.fd);
  if (it == _connections.end() || it->second->id != completion.connectionId ||
      it->second->requestSeq != completion.requestSeq || it->second->state != ConnectionState::Handling ||
      it->second->closed) {
    log::debug("Dropping late handler result for connection # {}", completion.connectionId);
    return;
  }
  Connection& conn = *it->second;
  if (completion.failed) {
    StatsCounters::Increment(_stats.handlerFailures);
  }
  sendResponse(conn, completion.response, conn.closeAfterWrite || completion.failed);
  processBuffered(conn);
}

void Worker::sendResponse(Connection& conn, const HttpResponse& response, bool forceClose) {
  ++conn.nbRequestsServed;
  StatsCounters::Increment(_stats.requestsServed);

  const bool close = forceClose || !_config.enableKeepAlive || isDraining() || conn.peerClosed ||
                     ResponseSerializer::HandlerRequestsClose(response) ||
                     (_config.maxRequestsPerConnection != 0 && conn.nbRequestsServed >= _config.maxRequestsPerConnection);
  conn.closeAfterWrite = close;

  SerializeOptions options;
  options.serverName = _config.serverName;
  options.now = SysClock::now();
  options.headRequest = conn.headRequest;
  options.keepAlive = !close;
  conn.writer.queue(ResponseSerializer::serialize(response, options));
  conn.headRequest = false;
  conn.writeStartTime = SteadyClock::now();
  conn.state = ConnectionState::Writing;
  flushResponse(conn);
}

void Worker::flushResponse(Connection& conn) {
  switch (conn.writer.flush(conn.fd())) {
    case WireWriter::FlushStatus::Error:
      closeConnection(conn);
      break;
    case WireWriter::FlushStatus::Pending:
      conn.state = ConnectionState::Writing;
      updateInterest(conn);
      break;
    default:
      onResponseWritten(conn);
      break;
  }
}

void Worker::onResponseWritten(Connection& conn) {
  if (conn.closeAfterWrite) {
    startLinger(conn);
    return;
  }
  const auto now = SteadyClock::now();
  conn.lastReadTime = now;
  if (conn.reader.bufferedBytes() == 0) {
    conn.state = ConnectionState::Idle;
  } else {
    conn.state = ConnectionState::Reading;
    conn.requestStartTime = now;
  }
  updateInterest(conn);
}

void Worker::startLinger(Connection& conn) {
  conn.reader.discardBuffered();
  if (conn.peerClosed || _config.closeLingerTimeout.count() == 0 || !ShutdownWrite(conn.fd())) {
    closeConnection(conn);
    return;
  }
  conn.state = ConnectionState::Closing;
  conn.lingerStartTime = SteadyClock::now();
  updateInterest(conn);
}

void Worker::updateInterest(Connection& conn) {
  const EventBmp wanted = conn.wantedEvents();
  if (wanted == conn.registeredEvents) {
    return;
  }
  if (!_eventLoop.mod(conn.fd(), wanted)) {
    closeConnection(conn);
    return;
  }
  conn.registeredEvents = wanted;
}

void Worker::applyDrain() {
  _drainApplied = true;
  uint32_t nbClosed = 0;
  for (auto& [fd, pConn] : _connections) {
    if (!pConn->closed && pConn->state == ConnectionState::Idle) {
      closeConnection(*pConn);
      ++nbClosed;
    }
  }
  log::debug("Worker {} draining: closed {} idle connections, {} in flight", _workerId, nbClosed,
             _connections.size() - nbClosed);
}

void Worker::sweepTimeouts(SteadyTimePoint now) {
  if (now - _lastSweep < _config.pollInterval) {
    return;
  }
  _lastSweep = now;

  for (auto& [fd, pConn] : _connections) {
    Connection& conn = *pConn;
    if (conn.closed) {
      continue;
    }
    switch (conn.state) {
      case ConnectionState::Idle:
        if (now - conn.lastReadTime >= _config.idleReadTimeout) {
          log::debug("Closing idle connection # {} from {}", conn.id, conn.peer);
          StatsCounters::Increment(_stats.timeouts);
          closeConnection(conn);
        }
        break;
      case ConnectionState::Reading:
        if (now - conn.lastReadTime >= _config.idleReadTimeout ||
            now - conn.requestStartTime >= _config.totalRequestTimeout) {
          log::warn("Read timeout on connection # {} from {}", conn.id, conn.peer);
          StatsCounters::Increment(_stats.timeouts);
          conn.reader.discardBuffered();
          conn.resetRequest();
          conn.headRequest = false;
          sendResponse(conn, ErrorResponseFor(http::ErrorKind::ReadTimeout), true);
        }
        break;
      case ConnectionState::Handling:
        if (now - conn.handlerStartTime >= _config.handlerTimeout) {
          log::warn("Handler timeout on connection # {} from {}", conn.id, conn.peer);
          StatsCounters::Increment(_stats.timeouts);
          ++conn.requestSeq;
          sendResponse(conn, ErrorResponseFor(http::ErrorKind::HandlerTimeout), true);
        }
        break;
      case ConnectionState::Writing:
        if (now - conn.writeStartTime >= _config.writeTimeout) {
          log::warn("Write timeout on connection # {} from {}", conn.id, conn.peer);
          StatsCounters::Increment(_stats.timeouts);
          closeConnection(conn);
        }
        break;
      case ConnectionState::Closing:
        if (now - conn.lingerStartTime >= _config.closeLingerTimeout) {
          closeConnection(conn);
        }
        break;
      default:
        break;
    }
  }
}

void Worker::closeConnection(Connection& conn) {
  if (conn.closed) {
    return;
  }
  conn.closed = true;
  _eventLoop.del(conn.fd());
  _closedFds.push_back(conn.fd());
  log::debug("Closing connection # {} from {} after {} requests", conn.id, conn.peer, conn.nbRequestsServed);
}

void Worker::reapClosed() {
  for (int fd : _closedFds) {
    _connections.erase(fd);
  }
  _closedFds.clear();
}

}  // namespace tern::internal
