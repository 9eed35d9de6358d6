#include "tern/signal-handler.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <iterator>

#include "tern/log.hpp"

namespace tern {

namespace {

constexpr int kHandledSignals[] = {SIGINT, SIGTERM};

// Written from the signal handler, lock free so that the write is async-signal-safe.
std::atomic<int> gReceivedSignal{0};
static_assert(std::atomic<int>::is_always_lock_free);

std::atomic<std::chrono::milliseconds::rep> gMaxDrainPeriodMs{30000};

struct sigaction gPreviousActions[std::size(kHandledSignals)];
bool gEnabled = false;

void OnTerminationSignal(int sigNum) { gReceivedSignal.store(sigNum, std::memory_order_relaxed); }

}  // namespace

void SignalHandler::Enable(std::chrono::milliseconds maxDrainPeriod) {
  gMaxDrainPeriodMs.store(maxDrainPeriod.count(), std::memory_order_relaxed);
  if (gEnabled) {
    return;
  }

  struct sigaction action{};
  action.sa_handler = OnTerminationSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;

  for (std::size_t signalPos = 0; signalPos < std::size(kHandledSignals); ++signalPos) {
    if (::sigaction(kHandledSignals[signalPos], &action, &gPreviousActions[signalPos]) != 0) {
      const auto err = errno;
      log::error("Unable to install handler for signal {}: {}", kHandledSignals[signalPos], std::strerror(err));
    }
  }
  gEnabled = true;
}

void SignalHandler::Disable() {
  if (!gEnabled) {
    return;
  }
  for (std::size_t signalPos = 0; signalPos < std::size(kHandledSignals); ++signalPos) {
    if (::sigaction(kHandledSignals[signalPos], &gPreviousActions[signalPos], nullptr) != 0) {
      const auto err = errno;
      log::error("Unable to restore handler of signal {}: {}", kHandledSignals[signalPos], std::strerror(err));
    }
  }
  gEnabled = false;
}

bool SignalHandler::IsStopRequested() { return gReceivedSignal.load(std::memory_order_relaxed) != 0; }

std::chrono::milliseconds SignalHandler::GetMaxDrainPeriod() {
  return std::chrono::milliseconds{gMaxDrainPeriodMs.load(std::memory_order_relaxed)};
}

void SignalHandler::ResetStopRequest() { gReceivedSignal.store(0, std::memory_order_relaxed); }

}  // namespace tern
