#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <semaphore>
#include <utility>

#include "tern/timedef.hpp"

namespace tern::internal {

class ConnectionLimiter;

// A unit of the connection semaphore, held for the whole lifetime of a client connection.
// The accept loop holds one in advance while waiting for the next client; it counts as an active connection only
// once activate() is called, when it is handed over with an accepted socket. Released on destruction.
class ConnectionPermit {
 public:
  ConnectionPermit() noexcept = default;

  ConnectionPermit(const ConnectionPermit&) = delete;
  ConnectionPermit(ConnectionPermit&& other) noexcept
      : _pLimiter(std::exchange(other._pLimiter, nullptr)), _activated(std::exchange(other._activated, false)) {}
  ConnectionPermit& operator=(const ConnectionPermit&) = delete;
  ConnectionPermit& operator=(ConnectionPermit&& other) noexcept;

  ~ConnectionPermit() { release(); }

  explicit operator bool() const noexcept { return _pLimiter != nullptr; }

  // Count this permit as an active connection. Idempotent.
  void activate() noexcept;

  [[nodiscard]] bool activated() const noexcept { return _activated; }

  // Give back the permit now. Idempotent.
  void release() noexcept;

 private:
  friend class ConnectionLimiter;

  explicit ConnectionPermit(ConnectionLimiter* pLimiter) noexcept : _pLimiter(pLimiter) {}

  ConnectionLimiter* _pLimiter{nullptr};
  bool _activated{false};
};

// Counting semaphore bounding the number of simultaneously open client connections.
// On top of the semaphore, it lets the accept loop wait for a permit release (used when accept reports file
// descriptor exhaustion) and the shutdown sequence wait for all connections to be closed.
class ConnectionLimiter {
 public:
  explicit ConnectionLimiter(uint32_t maxConnections);

  ConnectionLimiter(const ConnectionLimiter&) = delete;
  ConnectionLimiter(ConnectionLimiter&&) = delete;
  ConnectionLimiter& operator=(const ConnectionLimiter&) = delete;
  ConnectionLimiter& operator=(ConnectionLimiter&&) = delete;

  ~ConnectionLimiter() = default;

  // Acquire a permit, blocking up to timeout. std::nullopt if none became available in time.
  [[nodiscard]] std::optional<ConnectionPermit> tryAcquireFor(std::chrono::milliseconds timeout);

  // Non blocking version of tryAcquireFor.
  [[nodiscard]] std::optional<ConnectionPermit> tryAcquire();

  // Number of permits released so far. To be captured before calling waitForRelease.
  [[nodiscard]] uint64_t releaseGeneration() const;

  // Block until a permit is released after 'generation' was captured, interrupt() is called, or maxWait elapses.
  // Returns true if a permit was released.
  bool waitForRelease(uint64_t generation, std::chrono::milliseconds maxWait);

  // Block until all activated permits are back or deadline is reached.
  // Returns true if no connection is active anymore.
  bool waitUntilIdle(SteadyTimePoint deadline);

  // Wake up waitForRelease() callers, which return immediately from now on (until reset()).
  void interrupt();

  void reset();

  // Number of activated permits, that is connections handed over to a worker and not closed yet.
  [[nodiscard]] uint32_t active() const noexcept { return _nbActive.load(std::memory_order_relaxed); }

  [[nodiscard]] uint32_t maxConnections() const noexcept { return _maxConnections; }

 private:
  friend class ConnectionPermit;

  void activate() noexcept;

  void release(bool activated) noexcept;

  std::counting_semaphore<std::numeric_limits<int32_t>::max()> _semaphore;
  mutable std::mutex _mutex;
  std::condition_variable _releasedCv;
  uint64_t _releaseGeneration{};
  std::atomic<uint32_t> _nbActive;
  uint32_t _maxConnections;
  bool _interrupted{false};
};

}  // namespace tern::internal
