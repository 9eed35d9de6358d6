#pragma once

#include <atomic>
#include <cstdint>

#include "tern/server-stats.hpp"

namespace tern::internal {

// Counters updated concurrently by the accept loop and the workers. Relaxed ordering is enough as they are only
// read for reporting.
struct StatsCounters {
  static void Increment(std::atomic<uint64_t>& counter) noexcept { counter.fetch_add(1, std::memory_order_relaxed); }

  [[nodiscard]] ServerStats snapshot(uint32_t activeConnections) const noexcept {
    return ServerStats{acceptedConnections.load(std::memory_order_relaxed),
                       requestsServed.load(std::memory_order_relaxed),
                       parseErrors.load(std::memory_order_relaxed),
                       timeouts.load(std::memory_order_relaxed),
                       handlerFailures.load(std::memory_order_relaxed),
                       activeConnections};
  }

  std::atomic<uint64_t> acceptedConnections{};
  std::atomic<uint64_t> requestsServed{};
  std::atomic<uint64_t> parseErrors{};
  std::atomic<uint64_t> timeouts{};
  std::atomic<uint64_t> handlerFailures{};
};

}  // namespace tern::internal
