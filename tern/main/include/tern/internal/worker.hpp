#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include "tern/event-fd.hpp"
#include "tern/event-loop.hpp"
#include "tern/flat-hash-map.hpp"
#include "tern/http-response.hpp"
#include "tern/internal/connection-limiter.hpp"
#include "tern/internal/connection.hpp"
#include "tern/path-params.hpp"
#include "tern/router.hpp"
#include "tern/socket.hpp"
#include "tern/timedef.hpp"
#include "tern/vector.hpp"

namespace tern {

struct HttpServerConfig;

namespace internal {

class HandlerExecutor;
struct StatsCounters;

// Result of a handler invocation, sent back from the handler thread to the worker owning the connection.
struct HandlerCompletion {
  int fd{-1};
  uint64_t connectionId{};
  uint64_t requestSeq{};
  HttpResponse response;
  bool failed{false};
};

// Event loop thread owning a subset of the client connections.
// Connections are handed over by the accept loop with post(), handler results come back with postCompletion().
// Both may be called from any thread. Everything else runs on the worker thread.
class Worker {
 public:
  Worker(uint32_t workerId, const HttpServerConfig& config, const Router& router, HandlerExecutor& executor,
         StatsCounters& stats, std::stop_token requestStopToken);

  Worker(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker& operator=(Worker&&) = delete;

  // Equivalent to stop().
  ~Worker();

  // Launch the worker thread.
  void start();

  // Transfer ownership of a freshly accepted connection to this worker.
  void post(Socket socket, ConnectionPermit permit, std::string peer);

  void postCompletion(HandlerCompletion completion);

  // Stop reading new requests: idle connections are closed, in-flight requests complete with 'Connection: close'.
  void beginDrain();

  // Stop the thread and close all remaining connections.
  void stop();

  [[nodiscard]] uint32_t workerId() const noexcept { return _workerId; }

 private:
  struct PendingConnection {
    Socket socket;
    ConnectionPermit permit;
    std::string peer;
  };

  using ConnectionMap = flat_hash_map<int, std::unique_ptr<Connection>>;

  void run(const std::stop_token& stopToken);

  void processInbox();

  void acceptConnection(PendingConnection pending);

  void handleEvent(int fd, EventBmp eventBmp);

  void onReadable(Connection& conn);

  void onWritable(Connection& conn);

  // Frame and process the buffered requests until a handler is running, a response is pending or the buffer is
  // exhausted.
  void processBuffered(Connection& conn);

  void dispatchRequest(Connection& conn);

  void handleCompletion(HandlerCompletion& completion);

  void sendResponse(Connection& conn, const HttpResponse& response, bool forceClose);

  void flushResponse(Connection& conn);

  void onResponseWritten(Connection& conn);

  void startLinger(Connection& conn);

  void updateInterest(Connection& conn);

  void applyDrain();

  void sweepTimeouts(SteadyTimePoint now);

  void closeConnection(Connection& conn);

  void reapClosed();

  [[nodiscard]] bool isDraining() const noexcept { return _draining.load(std::memory_order_relaxed); }

  uint32_t _workerId;
  const HttpServerConfig& _config;
  const Router& _router;
  HandlerExecutor& _executor;
  StatsCounters& _stats;
  std::stop_token _requestStopToken;
  EventLoop _eventLoop;
  EventFd _wakeFd;
  ConnectionMap _connections;
  vector<int> _closedFds;
  SteadyTimePoint _lastSweep;
  uint64_t _nextConnectionId{};

  std::mutex _inboxMutex;
  vector<PendingConnection> _pendingConnections;
  vector<HandlerCompletion> _completions;

  std::atomic<bool> _draining{false};
  bool _drainApplied{false};
  std::jthread _thread;
};

}  // namespace internal
}  // namespace tern
