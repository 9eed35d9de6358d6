#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tern {

// Thin wrappers centralising socket system calls so that higher-level modules (http, main)
// never include platform networking headers directly.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Send data on a connected socket without raising SIGPIPE.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Receive at most len bytes. Returns the number of bytes read, 0 on orderly peer shutdown, -1 on error (errno set).
int64_t SafeRecv(int fd, void* data, std::size_t len) noexcept;

// Accept a pending connection on a listening socket. The new socket is non-blocking and close-on-exec.
// Returns the new fd, or -1 on error (errno is set, EAGAIN when no connection is pending).
int SafeAccept(int listenFd) noexcept;

// True for accept errors caused by file descriptor or kernel memory exhaustion (EMFILE, ENFILE, ENOBUFS, ENOMEM).
bool IsResourceExhaustionError(int err) noexcept;

// True for errors reporting a pending connection that failed before being accepted: accept can be retried
// immediately.
bool IsAbortedConnectionError(int err) noexcept;

// SOMAXCONN, the largest backlog accepted by listen.
int MaxListenBacklog() noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

// Returns "ip:port" of the remote peer of fd, or "unknown" if it cannot be determined.
std::string PeerAddressString(int fd);

}  // namespace tern
