#include "tern/wire-writer.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

#include "tern/log.hpp"
#include "tern/socket-ops.hpp"

namespace tern {

void WireWriter::queue(std::string data) {
  if (empty()) {
    _pending = std::move(data);
    _offset = 0;
  } else {
    _pending.append(data);
  }
}

WireWriter::FlushStatus WireWriter::flush(int fd) {
  while (!empty()) {
    const int64_t nbSent = SafeSend(fd, _pending.data() + _offset, _pending.size() - _offset);
    if (nbSent < 0) {
      const int err = errno;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        return FlushStatus::Pending;
      }
      log::debug("send on fd # {} failed: {}", fd, std::strerror(err));
      clear();
      return FlushStatus::Error;
    }
    _offset += static_cast<std::size_t>(nbSent);
  }
  clear();
  return FlushStatus::Done;
}

void WireWriter::clear() noexcept {
  _pending.clear();
  _offset = 0;
}

}  // namespace tern
