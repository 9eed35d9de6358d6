#include "tern/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "tern/errno-throw.hpp"
#include "tern/log.hpp"

namespace tern {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("eventfd creation failed");
  }
  log::trace("EventFd fd # {} opened", fd());
}

void EventFd::notify() const noexcept {
  // EAGAIN means the counter is saturated, the fd is readable anyway.
  if (::eventfd_write(fd(), 1) == -1 && errno != EAGAIN) {
    const auto err = errno;
    log::error("EventFd # {} notify failed: {}", fd(), std::strerror(err));
  }
}

uint64_t EventFd::drain() const noexcept {
  eventfd_t counter = 0;
  if (::eventfd_read(fd(), &counter) == -1) {
    const auto err = errno;
    if (err != EAGAIN) {
      log::error("EventFd # {} drain failed: {}", fd(), std::strerror(err));
    }
    return 0;
  }
  return counter;
}

}  // namespace tern
