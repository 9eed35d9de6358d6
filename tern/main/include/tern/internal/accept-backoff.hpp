#pragma once

#include <algorithm>
#include <chrono>

namespace tern::internal {

// Delay between two accept attempts after a failure that is not related to a single client.
// Starts at minDelay, doubles at each consecutive failure up to maxDelay, and goes back to minDelay on success.
class AcceptBackoff {
 public:
  AcceptBackoff(std::chrono::milliseconds minDelay, std::chrono::milliseconds maxDelay) noexcept
      : _minDelay(minDelay), _maxDelay(std::max(minDelay, maxDelay)), _current(minDelay) {}

  // Returns the delay to apply for this failure, and prepares the one of the next failure.
  std::chrono::milliseconds next() noexcept {
    const auto delay = _current;
    _current = std::min(2 * _current, _maxDelay);
    return delay;
  }

  void reset() noexcept { _current = _minDelay; }

  [[nodiscard]] std::chrono::milliseconds current() const noexcept { return _current; }

 private:
  std::chrono::milliseconds _minDelay;
  std::chrono::milliseconds _maxDelay;
  std::chrono::milliseconds _current;
};

}  // namespace tern::internal
