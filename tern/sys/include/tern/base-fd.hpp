#pragma once

namespace tern {

// Owning file descriptor, closed on destruction.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership without closing.
  [[nodiscard]] int release() noexcept;

  // Closes the current descriptor, if any, and takes ownership of fd.
  void reset(int fd = kClosedFd) noexcept;

  // No-op if already closed.
  void close() noexcept { reset(); }

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  int _fd;
};

}  // namespace tern
