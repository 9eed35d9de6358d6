#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "tern/vector.hpp"

namespace tern::internal {

// Fixed size pool of threads running request handlers, fed by a FIFO queue.
// Tasks are expected to handle their own exceptions.
class HandlerExecutor {
 public:
  using Task = std::function<void()>;

  // Throws std::invalid_argument if nbThreads is 0.
  explicit HandlerExecutor(uint32_t nbThreads);

  HandlerExecutor(const HandlerExecutor&) = delete;
  HandlerExecutor(HandlerExecutor&&) = delete;
  HandlerExecutor& operator=(const HandlerExecutor&) = delete;
  HandlerExecutor& operator=(HandlerExecutor&&) = delete;

  // Equivalent to stop().
  ~HandlerExecutor();

  // Enqueue a task. Throws std::runtime_error if the executor is stopped.
  void submit(Task task);

  // Drop the tasks not started yet. Returns the number of dropped tasks.
  std::size_t discardPending();

  // Refuse new tasks, let the queued ones run, and join all threads.
  void stop();

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _threads.size(); }

  [[nodiscard]] std::size_t queueSize() const;

 private:
  void run();

  vector<std::jthread> _threads;
  std::deque<Task> _tasks;
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  bool _stopped{false};
};

}  // namespace tern::internal
