#include "tern/http-server-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "tern/http-header.hpp"

namespace tern {

HttpServerConfig& HttpServerConfig::withBindAddress(std::string_view address) {
  this->bindAddress = address;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxConnections(uint32_t maxConnections) {
  this->maxConnections = maxConnections;
  return *this;
}

HttpServerConfig& HttpServerConfig::withNbWorkerThreads(uint32_t nbWorkerThreads) {
  this->nbWorkerThreads = nbWorkerThreads;
  return *this;
}

HttpServerConfig& HttpServerConfig::withNbHandlerThreads(uint32_t nbHandlerThreads) {
  this->nbHandlerThreads = nbHandlerThreads;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderCount(uint32_t maxHeaderCount) {
  this->maxHeaderCount = maxHeaderCount;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxPathBytes(std::size_t maxPathBytes) {
  this->maxPathBytes = maxPathBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxQueryBytes(std::size_t maxQueryBytes) {
  this->maxQueryBytes = maxQueryBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestsPerConnection(uint32_t maxRequestsPerConnection) {
  this->maxRequestsPerConnection = maxRequestsPerConnection;
  return *this;
}

HttpServerConfig& HttpServerConfig::withIdleReadTimeout(std::chrono::milliseconds timeout) {
  this->idleReadTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTotalRequestTimeout(std::chrono::milliseconds timeout) {
  this->totalRequestTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withHandlerTimeout(std::chrono::milliseconds timeout) {
  this->handlerTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withWriteTimeout(std::chrono::milliseconds timeout) {
  this->writeTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withShutdownGracePeriod(std::chrono::milliseconds gracePeriod) {
  this->shutdownGracePeriod = gracePeriod;
  return *this;
}

HttpServerConfig& HttpServerConfig::withCloseLingerTimeout(std::chrono::milliseconds timeout) {
  this->closeLingerTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withAcceptBackoff(std::chrono::milliseconds minBackoff,
                                                      std::chrono::milliseconds maxBackoff) {
  this->acceptBackoffMin = minBackoff;
  this->acceptBackoffMax = maxBackoff;
  return *this;
}

HttpServerConfig& HttpServerConfig::withServerName(std::string_view serverName) {
  this->serverName = serverName;
  return *this;
}

void HttpServerConfig::validate() const {
  if (bindAddress.empty()) {
    throw std::invalid_argument("bindAddress must not be empty");
  }
  if (maxConnections == 0) {
    throw std::invalid_argument("maxConnections must be > 0");
  }
  // Request line and Host header at least
  if (std::cmp_less(maxHeaderBytes, 128)) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxHeaderCount == 0) {
    throw std::invalid_argument("maxHeaderCount must be > 0");
  }
  if (maxPathBytes == 0) {
    throw std::invalid_argument("maxPathBytes must be > 0");
  }
  if (maxPathBytes + maxQueryBytes >= maxHeaderBytes) {
    throw std::invalid_argument("maxPathBytes + maxQueryBytes must be lower than maxHeaderBytes");
  }

  const auto checkPositive = [](std::chrono::milliseconds duration, const char* name) {
    if (duration.count() <= 0) {
      throw std::invalid_argument(std::string(name) + " must be > 0");
    }
  };
  checkPositive(idleReadTimeout, "idleReadTimeout");
  checkPositive(totalRequestTimeout, "totalRequestTimeout");
  checkPositive(handlerTimeout, "handlerTimeout");
  checkPositive(writeTimeout, "writeTimeout");
  checkPositive(pollInterval, "pollInterval");
  checkPositive(acceptBackoffMin, "acceptBackoffMin");

  if (shutdownGracePeriod.count() < 0) {
    throw std::invalid_argument("shutdownGracePeriod must be >= 0");
  }
  if (closeLingerTimeout.count() < 0) {
    throw std::invalid_argument("closeLingerTimeout must be >= 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (acceptBackoffMax < acceptBackoffMin) {
    throw std::invalid_argument("acceptBackoffMax must be >= acceptBackoffMin");
  }

  if (serverName.empty() || !std::ranges::all_of(serverName, http::IsValidHeaderValueChar)) {
    throw std::invalid_argument("serverName must be a non empty valid header value");
  }
}

}  // namespace tern
