#pragma once

#include <chrono>

namespace tern {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs SIGINT and SIGTERM handlers recording the termination request. A running HttpServer checks
  // IsStopRequested() at each poll interval and drains for at most maxDrainPeriod.
  // Calling it again only updates maxDrainPeriod.
  static void Enable(std::chrono::milliseconds maxDrainPeriod = std::chrono::milliseconds{30000});

  // Restores the handlers that were installed before Enable().
  static void Disable();

  static bool IsStopRequested();

  static std::chrono::milliseconds GetMaxDrainPeriod();

 private:
  friend class SignalHandlerTest;

  // Resets the stop-requested flag so that several tests can run in the same process.
  static void ResetStopRequest();
};

}  // namespace tern
