#pragma once

#include <cstdint>
#include <memory>
#include <span>

#include "tern/base-fd.hpp"
#include "tern/timedef.hpp"
#include "tern/vector.hpp"

struct epoll_event;

namespace tern {

// Readiness bits, same values as their EPOLL counterparts.
using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventOut = 0x004;
inline constexpr EventBmp EventErr = 0x008;
inline constexpr EventBmp EventHup = 0x010;
inline constexpr EventBmp EventRdHup = 0x2000;

struct ReadyEvent {
  int fd;
  EventBmp eventBmp;
};

// Level-triggered epoll instance owned by a single thread.
//
// The ready list is reused between polls. It starts with initialCapacity slots and doubles each time a poll fills it
// completely, so that a busy loop does not starve fds beyond the first slots.
// add(), mod() and del() log their failures and let the caller decide, usually by dropping the connection.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept;

  ~EventLoop();

  // Throws std::system_error if fd cannot be registered.
  void addOrThrow(int fd, EventBmp eventBmp) const;

  [[nodiscard]] bool add(int fd, EventBmp eventBmp) const;

  [[nodiscard]] bool mod(int fd, EventBmp eventBmp) const;

  void del(int fd) const;

  // Waits up to the poll timeout.
  //  - ready fds: non empty span
  //  - timeout or EINTR: empty span with a non null data()
  //  - epoll_wait failure (logged): empty span with a null data()
  // The span is invalidated by the next call.
  [[nodiscard]] std::span<const ReadyEvent> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_ready.size()); }

 private:
  BaseFd _epollFd;
  int _pollTimeoutMs;
  std::unique_ptr<epoll_event[]> _epollEvents;
  vector<ReadyEvent> _ready;
};

}  // namespace tern
