#include "tern/internal/connection.hpp"

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>

#include "tern/event-loop.hpp"
#include "tern/http-request.hpp"
#include "tern/http-server-config.hpp"
#include "tern/internal/connection-limiter.hpp"
#include "tern/socket.hpp"
#include "tern/timedef.hpp"

namespace tern::internal {

Connection::Connection(Socket socket, ConnectionPermit permit, std::string peer, uint64_t id,
                       const HttpServerConfig& config, std::stop_token stopToken, SteadyTimePoint now)
    : socket(std::move(socket)),
      permit(std::move(permit)),
      peer(std::move(peer)),
      id(id),
      reader(config.parserLimits(), config.maxBodyBytes),
      stopToken(std::move(stopToken)),
      lastReadTime(now),
      requestStartTime(now) {
  resetRequest();
}

void Connection::resetRequest() {
  request = std::make_shared<HttpRequest>();
  request->_peer = peer;
  request->_stopToken = stopToken;
}

EventBmp Connection::wantedEvents() const noexcept {
  switch (state) {
    case ConnectionState::Writing:
      return EventOut;
    case ConnectionState::Handling:
      return 0;
    default:
      return EventIn;
  }
}

}  // namespace tern::internal
