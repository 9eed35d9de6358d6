#include "tern/internal/handler-executor.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "tern/log.hpp"

namespace tern::internal {

HandlerExecutor::HandlerExecutor(uint32_t nbThreads) {
  if (nbThreads == 0) {
    throw std::invalid_argument("HandlerExecutor needs at least one thread");
  }
  _threads.reserve(nbThreads);
  try {
    for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
      _threads.emplace_back([this] { run(); });
    }
  } catch (const std::exception&) {
    stop();
    throw;
  }
}

HandlerExecutor::~HandlerExecutor() { stop(); }

void HandlerExecutor::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopped) {
      throw std::runtime_error("Cannot submit a task to a stopped HandlerExecutor");
    }
    _tasks.push_back(std::move(task));
  }
  _cv.notify_one();
}

std::size_t HandlerExecutor::discardPending() {
  std::lock_guard<std::mutex> lock(_mutex);
  const std::size_t nbDropped = _tasks.size();
  _tasks.clear();
  return nbDropped;
}

void HandlerExecutor::stop() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stopped = true;
  }
  _cv.notify_all();
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  _threads.clear();
}

std::size_t HandlerExecutor::queueSize() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _tasks.size();
}

void HandlerExecutor::run() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      _cv.wait(lock, [this] { return _stopped || !_tasks.empty(); });
      if (_tasks.empty()) {
        return;
      }
      task = std::move(_tasks.front());
      _tasks.pop_front();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      log::error("Uncaught exception in handler task: {}", ex.what());
    }
  }
}

}  // namespace tern::internal
