#include "tern/http-server.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "tern/base-fd.hpp"
#include "tern/event-loop.hpp"
#include "tern/http-server-config.hpp"
#include "tern/internal/accept-backoff.hpp"
#include "tern/internal/connection-limiter.hpp"
#include "tern/internal/handler-executor.hpp"
#include "tern/internal/stats-counters.hpp"
#include "tern/internal/worker.hpp"
#include "tern/log.hpp"
#include "tern/router.hpp"
#include "tern/server-stats.hpp"
#include "tern/signal-handler.hpp"
#include "tern/socket-ops.hpp"
#include "tern/socket.hpp"
#include "tern/timedef.hpp"
#include "tern/vector.hpp"

namespace tern {

namespace {

HttpServerConfig Validated(HttpServerConfig config) {
  config.validate();
  return config;
}

uint32_t NbThreadsOrHardware(uint32_t nbThreads) {
  if (nbThreads != 0) {
    return nbThreads;
  }
  return std::max(1U, std::thread::hardware_concurrency());
}

uint16_t ParsePort(std::string_view portStr, std::string_view address) {
  uint16_t port{};
  const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (portStr.empty() || errc != std::errc{} || ptr != portStr.data() + portStr.size()) {
    throw std::invalid_argument(std::string("Invalid port in listen address '").append(address).append("'"));
  }
  return port;
}

using WorkerPtr = std::unique_ptr<internal::Worker>;

void StopAll(vector<WorkerPtr>& workers, internal::HandlerExecutor& executor) {
  for (WorkerPtr& pWorker : workers) {
    pWorker->stop();
  }
  const auto nbDropped = executor.discardPending();
  if (nbDropped != 0) {
    log::warn("Dropped {} requests not started at shutdown", nbDropped);
  }
  // Waits for the handlers still running, their results go nowhere.
  executor.stop();
  workers.clear();
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, Router router)
    : _config(Validated(std::move(config))), _router(std::move(router)), _limiter(_config.maxConnections) {}

void HttpServer::listen() { run(_config.bindAddress, _config.port); }

void HttpServer::listen(std::string_view address) {
  const auto colonPos = address.find(':');
  if (colonPos == std::string_view::npos) {
    if (address.empty()) {
      throw std::invalid_argument("Empty listen address");
    }
    run(std::string(address), _config.port);
  } else {
    if (colonPos == 0) {
      throw std::invalid_argument(std::string("Missing ip in listen address '").append(address).append("'"));
    }
    run(std::string(address.substr(0, colonPos)), ParsePort(address.substr(colonPos + 1), address));
  }
}

void HttpServer::shutdown() {
  _lifecycle.requestStop();
  _limiter.interrupt();
}

ServerStats HttpServer::stats() const noexcept { return _stats.snapshot(_limiter.active()); }

void HttpServer::run(std::string bindAddress, uint16_t port) {
  if (!_lifecycle.tryEnterRunning()) {
    throw std::logic_error("HttpServer is already running");
  }
  _port.store(0, std::memory_order_release);

  _router.freeze();
  _requestStopSource = std::stop_source{};

  std::optional<internal::HandlerExecutor> executor;
  vector<WorkerPtr> workers;
  Socket listenSocket;
  try {
    listenSocket = Socket(Socket::Type::StreamNonBlock);
    listenSocket.bindAndListen(bindAddress, _config.reusePort, port, MaxListenBacklog());

    executor.emplace(NbThreadsOrHardware(_config.nbHandlerThreads));
    const uint32_t nbWorkers = NbThreadsOrHardware(_config.nbWorkerThreads);
    workers.reserve(nbWorkers);
    for (uint32_t workerId = 0; workerId < nbWorkers; ++workerId) {
      workers.push_back(std::make_unique<internal::Worker>(workerId, _config, _router, *executor, _stats,
                                                           _requestStopSource.get_token()));
      workers.back()->start();
    }
  } catch (const std::exception& ex) {
    log::error("Failed to start server on {}:{}: {}", bindAddress, port, ex.what());
    if (executor) {
      StopAll(workers, *executor);
    }
    _lifecycle.reset();
    _limiter.reset();
    throw;
  }

  _port.store(port, std::memory_order_release);
  log::info("Server listening on {}:{} ({} workers, {} handler threads, at most {} connections)", bindAddress, port,
            workers.size(), executor->nbThreads(), _config.maxConnections);

  EventLoop acceptLoop(_config.pollInterval, 2U);
  acceptLoop.addOrThrow(listenSocket.fd(), EventIn);
  acceptLoop.addOrThrow(_lifecycle.wakeupFd.fd(), EventIn);

  std::chrono::milliseconds gracePeriod = _config.shutdownGracePeriod;
  internal::AcceptBackoff acceptBackoff(_config.acceptBackoffMin, _config.acceptBackoffMax);
  std::optional<internal::ConnectionPermit> permit;
  std::size_t nextWorker = 0;

  while (!_lifecycle.isStopRequested()) {
    if (SignalHandler::IsStopRequested()) {
      gracePeriod = std::min(gracePeriod, SignalHandler::GetMaxDrainPeriod());
      log::info("Termination signal received");
      break;
    }
    if (!permit) {
      permit = _limiter.tryAcquireFor(_config.pollInterval);
      if (!permit) {
        continue;
      }
    }

    const auto events = acceptLoop.poll();
    bool listenReady = false;
    for (const ReadyEvent& event : events) {
      if (event.fd == listenSocket.fd()) {
        listenReady = true;
      } else {
        _lifecycle.wakeupFd.drain();
      }
    }

    while (listenReady && permit) {
      const int fd = SafeAccept(listenSocket.fd());
      if (fd == -1) {
        const int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK) {
          break;
        }
        if (IsAbortedConnectionError(err)) {
          continue;
        }
        if (IsResourceExhaustionError(err)) {
          const auto delay = acceptBackoff.next();
          log::warn("accept failed ({}), waiting up to {} ms for a connection to close", std::strerror(err),
                    delay.count());
          permit.reset();
          _limiter.waitForRelease(_limiter.releaseGeneration(), delay);
          break;
        }
        const auto delay = acceptBackoff.next();
        log::warn("accept failed ({}), retrying in {} ms", std::strerror(err), delay.count());
        _lifecycle.sleepFor(delay);
        break;
      }
      acceptBackoff.reset();

      Socket clientSocket(BaseFd{fd});
      std::string peer = PeerAddressString(fd);
      internal::StatsCounters::Increment(_stats.acceptedConnections);
      permit->activate();
      workers[nextWorker]->post(std::move(clientSocket), std::move(*permit), std::move(peer));
      nextWorker = (nextWorker + 1) % workers.size();
      permit = _limiter.tryAcquire();
    }
  }

  // Graceful shutdown
  log::info("Shutting down server on port {} ({} active connections, grace period {} ms)", port, _limiter.active(),
            gracePeriod.count());
  _lifecycle.enterDraining();
  permit.reset();
  acceptLoop.del(listenSocket.fd());
  listenSocket.close();
  for (WorkerPtr& pWorker : workers) {
    pWorker->beginDrain();
  }
  if (!_limiter.waitUntilIdle(SteadyClock::now() + gracePeriod)) {
    log::warn("Grace period elapsed with {} active connection(s), closing them", _limiter.active());
  }
  _requestStopSource.request_stop();
  StopAll(workers, *executor);

  _lifecycle.reset();
  _limiter.reset();
  log::info("Server stopped");
}

}  // namespace tern
