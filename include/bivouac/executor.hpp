#pragma once

// bivouac/executor.hpp - Fixed-size worker pool for blocking operations.
//
// A run spends nearly all of its time in blocking syscalls (fork/wait, file
// I/O). Callers submit those as tasks and get a std::future back, so many
// runs can be in flight without one thread per caller.
//
// SHUTDOWN:
//   The destructor stops accepting work, drains the queue and joins every
//   worker. Tasks already queued still run to completion.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace bivouac {

class Executor {
 public:
  // threads == 0 selects std::thread::hardware_concurrency() (at least 1).
  explicit Executor(std::size_t threads = 0);
  ~Executor();

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  // Queues f on a worker thread. Exceptions thrown by f surface from
  // future::get(). Throws std::runtime_error after shutdown began.
  template <typename F>
  std::future<std::invoke_result_t<F>> spawn_blocking(F&& f) {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_)
        throw std::runtime_error("executor is shutting down");
      queue_.emplace_back([task] { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  std::size_t thread_count() const { return workers_.size(); }
  std::size_t queue_depth() const;

 private:
  void worker_loop();

  std::vector<std::thread> workers_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stopping_{false};
};

}  // namespace bivouac
