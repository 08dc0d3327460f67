#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace rf::engine {

// Runs each submitted unit on its own thread. Units poll cancel_requested()
// between steps; stop() asks them to finish and waits a bounded time.
class AsyncTaskService {
public:
  AsyncTaskService();
  AsyncTaskService(AsyncTaskService const &) = delete;
  AsyncTaskService &operator=(AsyncTaskService const &) = delete;
  // Joins whatever stop() left running.
  ~AsyncTaskService();

  // False once stop() was called.
  bool submit(std::function<void()> task);

  // Requests cancellation and waits up to grace for in-flight units.
  // Returns false on timeout.
  bool stop(std::chrono::milliseconds grace);

  bool cancel_requested() const noexcept;
  std::size_t in_flight() const;

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_finished_locked();

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::vector<Worker> workers_;
  std::size_t running_ = 0;
  std::atomic<bool> cancel_requested_{false};
};

} // namespace rf::engine
