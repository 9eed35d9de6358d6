#include "tern/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "tern/log.hpp"

namespace tern {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    reset(other.release());
  }
  return *this;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::reset(int fd) noexcept {
  const int oldFd = std::exchange(_fd, fd);
  if (oldFd == kClosedFd || oldFd == fd) {
    return;
  }
  // Linux releases the descriptor even when close() fails with EINTR, so it is never retried.
  if (::close(oldFd) != 0 && errno != EINTR) {
    const auto err = errno;
    log::error("close of fd # {} failed: {}", oldFd, std::strerror(err));
    return;
  }
  log::trace("fd # {} closed", oldFd);
}

}  // namespace tern
