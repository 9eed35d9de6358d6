#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tern {

// Outgoing bytes of a connection, flushed on a non-blocking socket.
class WireWriter {
 public:
  enum class FlushStatus : uint8_t { Done, Pending, Error };

  void queue(std::string data);

  // Write as many queued bytes as the socket accepts.
  //  - Done:    everything queued was written.
  //  - Pending: the socket is full, retry when it becomes writable.
  //  - Error:   the connection is broken, the remaining bytes are dropped.
  FlushStatus flush(int fd);

  [[nodiscard]] bool empty() const noexcept { return _offset == _pending.size(); }

  [[nodiscard]] std::size_t remainingBytes() const noexcept { return _pending.size() - _offset; }

  void clear() noexcept;

 private:
  std::string _pending;
  std::size_t _offset{};
};

}  // namespace tern
