#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "tern/base-fd.hpp"

namespace tern {

// RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Create a new socket of the given type.
  // Throws std::system_error on failure.
  explicit Socket(Type type);

  // Adopt an already opened socket fd (for instance, the result of accept4).
  explicit Socket(BaseFd baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to bindAddress:port and start listening. If port is 0, an ephemeral port is chosen and
  // written back into 'port'.
  // Throws std::invalid_argument if bindAddress is not a valid IPv4 address, std::system_error on syscall failure.
  void bindAndListen(std::string_view bindAddress, bool reusePort, uint16_t& port, int backlog);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tern
