#pragma once

#include <cstdint>

#include "tern/base-fd.hpp"

namespace tern {

// Non-blocking eventfd used to wake up a thread sleeping in EventLoop::poll() from another thread.
class EventFd {
 public:
  EventFd();

  // Thread safe. Makes fd() readable until the next drain().
  void notify() const noexcept;

  // Resets the counter. Returns the number of notifications received since the previous drain, 0 if none.
  uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tern
