#include "tern/socket-ops.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tern {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  while (true) {
    const auto ret = ::send(fd, data, len, MSG_NOSIGNAL);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(ret);
  }
}

int64_t SafeRecv(int fd, void* data, std::size_t len) noexcept {
  while (true) {
    const auto ret = ::recv(fd, data, len, 0);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(ret);
  }
}

int SafeAccept(int listenFd) noexcept {
  while (true) {
    const int fd = ::accept4(listenFd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd == -1 && errno == EINTR) {
      continue;
    }
    return fd;
  }
}

bool IsResourceExhaustionError(int err) noexcept {
  return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
}

bool IsAbortedConnectionError(int err) noexcept {
  // Linux passes some pending network errors of the new socket as accept errors.
  return err == ECONNABORTED || err == EPROTO || err == ENETDOWN || err == ENOPROTOOPT || err == EHOSTDOWN ||
         err == ENONET || err == EHOSTUNREACH || err == EOPNOTSUPP || err == ENETUNREACH;
}

int MaxListenBacklog() noexcept { return SOMAXCONN; }

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

std::string PeerAddressString(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0 || addr.sin_family != AF_INET) {
    return "unknown";
  }
  char ipBuf[INET_ADDRSTRLEN];
  if (::inet_ntop(AF_INET, &addr.sin_addr, ipBuf, sizeof(ipBuf)) == nullptr) {
    return "unknown";
  }
  std::string out(ipBuf);
  out.push_back(':');
  out.append(std::to_string(ntohs(addr.sin_port)));
  return out;
}

}  // namespace tern
