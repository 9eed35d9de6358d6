#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>

#include "tern/http-server-config.hpp"
#include "tern/internal/connection-limiter.hpp"
#include "tern/internal/lifecycle.hpp"
#include "tern/internal/stats-counters.hpp"
#include "tern/router.hpp"
#include "tern/server-stats.hpp"

namespace tern {

// HttpServer
//  - listen() binds the listening socket and runs the accept loop in the calling thread until shutdown.
//    Accepted connections are spread over nbWorkerThreads event loop threads, handlers run on a pool of
//    nbHandlerThreads threads.
//  - At most maxConnections client connections are open at the same time. When the cap is reached, the server
//    stops accepting and leaves new connections in the kernel backlog.
//  - shutdown() may be called from any thread (handlers included): the server stops accepting, lets in-flight
//    requests complete for up to shutdownGracePeriod, then closes everything. listen() returns once all threads
//    are joined.
//
// Example:
//   HttpServer server(HttpServerConfig{}.withPort(8080));
//   server.router().route(http::Method::GET, "/hello", [](const HttpRequest&, const PathParams&) {
//     return HttpResponse("Hello");
//   });
//   server.listen();
class HttpServer {
 public:
  // Throws std::invalid_argument if the config is not valid.
  explicit HttpServer(HttpServerConfig config, Router router = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  // The server must not be running anymore.
  ~HttpServer() = default;

  // Routes can only be added before listen() is called. The router is frozen afterwards.
  Router& router() noexcept { return _router; }

  [[nodiscard]] const Router& router() const noexcept { return _router; }

  // Bind on the configured address and port, and serve until shutdown() is called (or, if SignalHandler is
  // enabled, until SIGINT or SIGTERM is received). Blocking.
  // Throws std::system_error if the socket cannot be bound, std::logic_error if the server is already running.
  void listen();

  // Same as listen(), on the given address: "ip" (configured port) or "ip:port".
  // Throws std::invalid_argument if address cannot be parsed.
  void listen(std::string_view address);

  // Request a graceful shutdown. Thread-safe and idempotent.
  // If called before listen(), the next call to listen() returns as soon as the socket is bound.
  void shutdown();

  // Effective listening port, once bound (useful with port 0).
  [[nodiscard]] uint16_t port() const noexcept { return _port.load(std::memory_order_acquire); }

  // True from the moment listen() bound the socket until it starts draining.
  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning() && port() != 0; }

  [[nodiscard]] ServerStats stats() const noexcept;

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

 private:
  void run(std::string bindAddress, uint16_t port);

  HttpServerConfig _config;
  Router _router;
  internal::Lifecycle _lifecycle;
  internal::ConnectionLimiter _limiter;
  internal::StatsCounters _stats;
  std::stop_source _requestStopSource;
  std::atomic<uint16_t> _port{0};
};

}  // namespace tern
