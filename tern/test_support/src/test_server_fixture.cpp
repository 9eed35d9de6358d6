#include "tern/test_server_fixture.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <thread>
#include <utility>

#include "tern/http-server-config.hpp"
#include "tern/http-server.hpp"
#include "tern/log.hpp"
#include "tern/router.hpp"

namespace tern::test {

TestServer::TestServer(HttpServerConfig cfg, const std::function<void(Router&)>& initializer,
                       std::chrono::milliseconds pollPeriod)
    : server(std::move(cfg.withBindAddress("127.0.0.1").withPollInterval(pollPeriod))) {
  if (initializer) {
    initializer(server.router());
  }
  _thread = std::jthread([this] {
    try {
      server.listen();
    } catch (const std::exception& ex) {
      log::error("Test server listen() failed: {}", ex.what());
    }
  });

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
  while (!server.isRunning() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  _port = server.port();
  if (_port == 0) {
    log::error("Test server did not start within 2 s");
  }
}

void TestServer::stop() {
  server.shutdown();
  join();
}

void TestServer::join() {
  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace tern::test
