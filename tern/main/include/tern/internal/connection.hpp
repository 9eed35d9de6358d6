#pragma once

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

#include "tern/event-loop.hpp"
#include "tern/http-request.hpp"
#include "tern/internal/connection-limiter.hpp"
#include "tern/socket.hpp"
#include "tern/timedef.hpp"
#include "tern/wire-reader.hpp"
#include "tern/wire-writer.hpp"

namespace tern {

struct HttpServerConfig;

namespace internal {

//  Idle     -> Reading   first bytes of a request received
//  Reading  -> Handling  request framed and routed to a handler
//  Reading  -> Writing   error or 404 / 405 response (also directly from Idle)
//  Handling -> Writing   handler result (or 504) ready
//  Writing  -> Idle      response flushed on a keep-alive connection
//  Writing  -> Closing   response flushed, connection to be closed: write side shut down, late bytes discarded
enum class ConnectionState : uint8_t { Idle, Reading, Handling, Writing, Closing };

constexpr std::string_view ConnectionStateToStr(ConnectionState state) noexcept {
  switch (state) {
    case ConnectionState::Idle:
      return "idle";
    case ConnectionState::Reading:
      return "reading";
    case ConnectionState::Handling:
      return "handling";
    case ConnectionState::Writing:
      return "writing";
    case ConnectionState::Closing:
      return "closing";
    default:
      return "unknown";
  }
}

// Per client connection state, owned by a single Worker thread.
class Connection {
 public:
  Connection(Socket socket, ConnectionPermit permit, std::string peer, uint64_t id, const HttpServerConfig& config,
             std::stop_token stopToken, SteadyTimePoint now);

  [[nodiscard]] int fd() const noexcept { return socket.fd(); }

  // Replace the current request by a fresh one. The previous one may still be referenced by a running handler.
  void resetRequest();

  // Epoll interest matching the current state.
  [[nodiscard]] EventBmp wantedEvents() const noexcept;

  Socket socket;
  ConnectionPermit permit;
  std::string peer;
  uint64_t id;
  WireReader reader;
  WireWriter writer;
  std::shared_ptr<HttpRequest> request;
  std::stop_token stopToken;
  SteadyTimePoint lastReadTime;
  SteadyTimePoint requestStartTime;
  SteadyTimePoint handlerStartTime;
  SteadyTimePoint writeStartTime;
  SteadyTimePoint lingerStartTime;
  // Incremented for each request handed to a handler, and when a handler times out, so that late handler results
  // can be recognized.
  uint64_t requestSeq{};
  uint32_t nbRequestsServed{};
  EventBmp registeredEvents{EventIn};
  ConnectionState state{ConnectionState::Idle};
  bool closeAfterWrite{false};
  bool peerClosed{false};
  bool headRequest{false};
  bool closed{false};
};

}  // namespace internal
}  // namespace tern
