#pragma once

#include <cstdint>

namespace tern {

// Snapshot of the counters of an HttpServer, cumulated since its construction (except activeConnections).
struct ServerStats {
  uint64_t acceptedConnections{};
  uint64_t requestsServed{};
  uint64_t parseErrors{};
  uint64_t timeouts{};
  uint64_t handlerFailures{};
  uint32_t activeConnections{};

  bool operator==(const ServerStats&) const noexcept = default;
};

}  // namespace tern
