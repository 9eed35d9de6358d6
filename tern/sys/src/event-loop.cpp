#include "tern/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>

#include "tern/errno-throw.hpp"
#include "tern/log.hpp"
#include "tern/timedef.hpp"

namespace tern {

static_assert(EventIn == EPOLLIN);
static_assert(EventOut == EPOLLOUT);
static_assert(EventErr == EPOLLERR);
static_assert(EventHup == EPOLLHUP);
static_assert(EventRdHup == EPOLLRDHUP);

namespace {

bool EpollCtl(int epollFd, int op, int fd, EventBmp eventBmp) {
  epoll_event ev{};
  ev.events = eventBmp;
  ev.data.fd = fd;
  return ::epoll_ctl(epollFd, op, fd, &ev) == 0;
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _epollFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pollTimeoutMs(static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count())),
      _epollEvents(std::make_unique<epoll_event[]>(std::max(1U, initialCapacity))),
      _ready(std::max(1U, initialCapacity)) {
  if (!_epollFd) {
    throw_errno("epoll_create1 failed");
  }
  log::trace("EventLoop fd # {} opened", _epollFd.fd());
}

EventLoop::EventLoop(EventLoop&&) noexcept = default;
EventLoop& EventLoop::operator=(EventLoop&&) noexcept = default;
EventLoop::~EventLoop() = default;

void EventLoop::addOrThrow(int fd, EventBmp eventBmp) const {
  if (!EpollCtl(_epollFd.fd(), EPOLL_CTL_ADD, fd, eventBmp)) {
    throw_errno("epoll_ctl ADD failed for fd # {}", fd);
  }
}

bool EventLoop::add(int fd, EventBmp eventBmp) const {
  if (!EpollCtl(_epollFd.fd(), EPOLL_CTL_ADD, fd, eventBmp)) {
    const auto err = errno;
    log::error("epoll_ctl ADD failed for fd # {} (events=0x{:x}): {}", fd, eventBmp, std::strerror(err));
    return false;
  }
  return true;
}

bool EventLoop::mod(int fd, EventBmp eventBmp) const {
  if (!EpollCtl(_epollFd.fd(), EPOLL_CTL_MOD, fd, eventBmp)) {
    const auto err = errno;
    log::error("epoll_ctl MOD failed for fd # {} (events=0x{:x}): {}", fd, eventBmp, std::strerror(err));
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_epollFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed for fd # {}: {}", fd, std::strerror(err));
  }
}

std::span<const ReadyEvent> EventLoop::poll() {
  const auto capacityBeforePoll = _ready.size();
  const int nbFds =
      ::epoll_wait(_epollFd.fd(), _epollEvents.get(), static_cast<int>(capacityBeforePoll), _pollTimeoutMs);
  if (nbFds == -1) {
    const auto err = errno;
    if (err == EINTR) {
      return {_ready.data(), 0U};
    }
    log::error("epoll_wait failed for fd # {}: {}", _epollFd.fd(), std::strerror(err));
    return {};
  }

  const auto nbReady = static_cast<std::size_t>(nbFds);
  for (std::size_t eventPos = 0; eventPos < nbReady; ++eventPos) {
    _ready[eventPos] = ReadyEvent{_epollEvents[eventPos].data.fd, _epollEvents[eventPos].events};
  }

  if (nbReady == capacityBeforePoll) {
    const auto newCapacity = capacityBeforePoll * 2U;
    _epollEvents = std::make_unique<epoll_event[]>(newCapacity);
    _ready.resize(newCapacity);
    log::debug("EventLoop fd # {} saturated, capacity grown to {}", _epollFd.fd(), newCapacity);
  }

  return {_ready.data(), nbReady};
}

}  // namespace tern
