#include "tern/internal/connection-limiter.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "tern/timedef.hpp"

namespace tern::internal {

ConnectionPermit& ConnectionPermit::operator=(ConnectionPermit&& other) noexcept {
  if (this != &other) {
    release();
    _pLimiter = std::exchange(other._pLimiter, nullptr);
    _activated = std::exchange(other._activated, false);
  }
  return *this;
}

void ConnectionPermit::activate() noexcept {
  if (_pLimiter != nullptr && !_activated) {
    _activated = true;
    _pLimiter->activate();
  }
}

void ConnectionPermit::release() noexcept {
  if (_pLimiter != nullptr) {
    std::exchange(_pLimiter, nullptr)->release(std::exchange(_activated, false));
  }
}

ConnectionLimiter::ConnectionLimiter(uint32_t maxConnections)
    : _semaphore(static_cast<std::ptrdiff_t>(maxConnections)), _nbActive(0), _maxConnections(maxConnections) {
  if (maxConnections == 0) {
    throw std::invalid_argument("maxConnections must be > 0");
  }
}

std::optional<ConnectionPermit> ConnectionLimiter::tryAcquireFor(std::chrono::milliseconds timeout) {
  if (!_semaphore.try_acquire_for(timeout)) {
    return std::nullopt;
  }
  return ConnectionPermit(this);
}

std::optional<ConnectionPermit> ConnectionLimiter::tryAcquire() {
  if (!_semaphore.try_acquire()) {
    return std::nullopt;
  }
  return ConnectionPermit(this);
}

void ConnectionLimiter::activate() noexcept { _nbActive.fetch_add(1, std::memory_order_relaxed); }

void ConnectionLimiter::release(bool activated) noexcept {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (activated) {
      _nbActive.fetch_sub(1, std::memory_order_relaxed);
    }
    ++_releaseGeneration;
  }
  _semaphore.release();
  _releasedCv.notify_all();
}

uint64_t ConnectionLimiter::releaseGeneration() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _releaseGeneration;
}

bool ConnectionLimiter::waitForRelease(uint64_t generation, std::chrono::milliseconds maxWait) {
  std::unique_lock<std::mutex> lock(_mutex);
  return _releasedCv.wait_for(lock, maxWait, [this, generation] {
    return _interrupted || _releaseGeneration != generation;
  }) && _releaseGeneration != generation;
}

bool ConnectionLimiter::waitUntilIdle(SteadyTimePoint deadline) {
  std::unique_lock<std::mutex> lock(_mutex);
  return _releasedCv.wait_until(lock, deadline, [this] { return _nbActive.load(std::memory_order_relaxed) == 0; });
}

void ConnectionLimiter::interrupt() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _interrupted = true;
  }
  _releasedCv.notify_all();
}

void ConnectionLimiter::reset() {
  std::lock_guard<std::mutex> lock(_mutex);
  _interrupted = false;
}

}  // namespace tern::internal
