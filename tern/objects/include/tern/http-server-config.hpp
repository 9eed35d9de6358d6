#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "tern/request-parser.hpp"

namespace tern {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // IPv4 address to bind. HttpServer::listen(address) overrides it.
  std::string bindAddress{"0.0.0.0"};

  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After listen() started
  // you can retrieve the effective port via HttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT on the listening socket. Disabled by default.
  bool reusePort{false};

  // If true, disables the Nagle algorithm on accepted sockets, favoring latency over network efficiency.
  // Default: false.
  bool tcpNoDelay{false};

  // ============================
  // Concurrency
  // ============================
  // Maximum number of simultaneously open client connections (size of the connection semaphore).
  // When reached, the server stops accepting and lets the kernel backlog absorb new connections. Default: 1024.
  uint32_t maxConnections{1024};

  // Number of event loop threads owning the client sockets. 0 means the number of hardware threads.
  uint32_t nbWorkerThreads{0};

  // Number of threads running the handlers. 0 means the number of hardware threads.
  uint32_t nbHandlerThreads{0};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum size of the request head (request line + all headers + CRLFCRLF). Exceeding it yields 431.
  // Default: 32 KiB.
  std::size_t maxHeaderBytes{32UL * 1024UL};

  // Maximum number of header lines. Exceeding it yields 431. Default: 100.
  uint32_t maxHeaderCount{100};

  // Maximum declared Content-Length. Exceeding it yields 413 before any body byte is read. Default: 1 MiB.
  std::size_t maxBodyBytes{1UL << 20};

  // Maximum lengths of the path and of the query parts of the request target. Exceeding them yields 414.
  std::size_t maxPathBytes{8UL * 1024UL};
  std::size_t maxQueryBytes{8UL * 1024UL};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // Whether persistent connections are enabled. When false, the server closes after each response.
  bool enableKeepAlive{true};

  // Maximum number of requests served on a single connection, 0 for unlimited.
  // The last allowed response carries 'Connection: close'.
  uint32_t maxRequestsPerConnection{0};

  // ============================
  // Timeouts
  // ============================
  // Maximum duration without receiving any byte while a request is expected or partially received.
  // A connection idle between requests is silently closed, a partial request is answered with 408.
  std::chrono::milliseconds idleReadTimeout{std::chrono::seconds{30}};

  // Maximum duration between the first byte of a request and its complete framing (head and body). 408 on expiry.
  std::chrono::milliseconds totalRequestTimeout{std::chrono::seconds{60}};

  // Maximum duration of a handler invocation. 504 on expiry, the connection is then closed.
  // The handler itself is not interrupted, its late result is discarded.
  std::chrono::milliseconds handlerTimeout{std::chrono::seconds{30}};

  // Maximum duration to flush a response. The connection is simply closed on expiry.
  std::chrono::milliseconds writeTimeout{std::chrono::seconds{30}};

  // Maximum duration given to in-flight requests to complete after shutdown() was called.
  std::chrono::milliseconds shutdownGracePeriod{std::chrono::seconds{30}};

  // After a response closing the connection, the write side is shut down and late client bytes are discarded
  // for at most this duration before closing the socket, so that the client reliably receives the response.
  std::chrono::milliseconds closeLingerTimeout{std::chrono::seconds{1}};

  // Maximum blocking duration of a single event loop poll. It bounds the latency of timeout enforcement and of
  // shutdown detection. Default: 50 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{50}};

  // Backoff between retries of a failed accept (fd exhaustion excluded), doubling from min up to max.
  std::chrono::milliseconds acceptBackoffMin{std::chrono::milliseconds{10}};
  std::chrono::milliseconds acceptBackoffMax{std::chrono::seconds{1}};

  // ============================
  // Response
  // ============================
  // Value of the Server header injected in all responses.
  std::string serverName{"tern"};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Limits to give to the RequestParser.
  [[nodiscard]] ParserLimits parserLimits() const noexcept {
    return ParserLimits{maxHeaderBytes, maxHeaderCount, maxPathBytes, maxQueryBytes};
  }

  HttpServerConfig& withBindAddress(std::string_view address);

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withMaxConnections(uint32_t maxConnections);

  HttpServerConfig& withNbWorkerThreads(uint32_t nbWorkerThreads);

  HttpServerConfig& withNbHandlerThreads(uint32_t nbHandlerThreads);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withMaxHeaderCount(uint32_t maxHeaderCount);

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  HttpServerConfig& withMaxPathBytes(std::size_t maxPathBytes);

  HttpServerConfig& withMaxQueryBytes(std::size_t maxQueryBytes);

  HttpServerConfig& withKeepAliveMode(bool on = true);

  HttpServerConfig& withMaxRequestsPerConnection(uint32_t maxRequestsPerConnection);

  HttpServerConfig& withIdleReadTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withTotalRequestTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withHandlerTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withWriteTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withShutdownGracePeriod(std::chrono::milliseconds gracePeriod);

  HttpServerConfig& withCloseLingerTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  HttpServerConfig& withAcceptBackoff(std::chrono::milliseconds minBackoff, std::chrono::milliseconds maxBackoff);

  HttpServerConfig& withServerName(std::string_view serverName);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace tern
