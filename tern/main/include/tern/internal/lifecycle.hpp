#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "tern/event-fd.hpp"

namespace tern::internal {

// Run state of an HttpServer, shared between the thread blocked in listen() and the threads calling shutdown().
struct Lifecycle {
  enum class State : uint8_t { Idle, Running, Draining };

  Lifecycle() = default;

  Lifecycle(const Lifecycle&) = delete;
  Lifecycle(Lifecycle&&) = delete;
  Lifecycle& operator=(const Lifecycle&) = delete;
  Lifecycle& operator=(Lifecycle&&) = delete;

  ~Lifecycle() = default;

  void reset() noexcept {
    state.store(State::Idle, std::memory_order_relaxed);
    stopRequested.store(false, std::memory_order_relaxed);
  }

  // Atomically switch from Idle to Running. Returns false if the server is already started.
  bool tryEnterRunning() noexcept {
    State expected = State::Idle;
    return state.compare_exchange_strong(expected, State::Running, std::memory_order_relaxed);
  }

  void enterDraining() noexcept { state.store(State::Draining, std::memory_order_relaxed); }

  // Flag the stop request and wake up the accept loop wherever it is blocked.
  void requestStop() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      stopRequested.store(true, std::memory_order_relaxed);
    }
    cv.notify_all();
    wakeupFd.notify();
  }

  // Sleep for duration, or less if a stop is requested meanwhile.
  // Returns true if a stop was requested.
  bool sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, duration, [this] { return stopRequested.load(std::memory_order_relaxed); });
  }

  [[nodiscard]] bool isIdle() const noexcept { return state.load(std::memory_order_relaxed) == State::Idle; }
  [[nodiscard]] bool isRunning() const noexcept { return state.load(std::memory_order_relaxed) == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return state.load(std::memory_order_relaxed) == State::Draining; }
  [[nodiscard]] bool isStopRequested() const noexcept { return stopRequested.load(std::memory_order_relaxed); }

  // Wakeup fd (eventfd) used to interrupt epoll_wait promptly when shutdown() is invoked from another thread.
  EventFd wakeupFd;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<State> state{State::Idle};
  std::atomic<bool> stopRequested{false};
};

}  // namespace tern::internal
