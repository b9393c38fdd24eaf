#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "errors.hpp"

namespace loom::primitives {

class thread_pool;

namespace _thread_pool_detail {

// Pool whose worker is the calling thread, null elsewhere.
inline const thread_pool*& current_pool() noexcept {
  thread_local const thread_pool* pool = nullptr;
  return pool;
}

}  // namespace _thread_pool_detail

// Fixed set of workers draining one FIFO queue. Tasks still queued when the
// pool is destroyed are run before the workers exit.
class thread_pool {
 public:
  explicit thread_pool(std::size_t num_threads = std::thread::hardware_concurrency()) {
    if (num_threads == 0) {
      num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
      workers_.emplace_back([this] -> void { worker_thread(); });
    }
  }

  ~thread_pool() {
    {
      std::scoped_lock lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  thread_pool(const thread_pool&)                    = delete;
  auto operator=(const thread_pool&) -> thread_pool& = delete;

  void submit(std::function<void()> task) {
    {
      std::scoped_lock lock(mutex_);
      if (stop_) {
        throw configuration_error("task submitted to a stopped thread pool");
      }
      queue_.push(std::move(task));
    }
    cv_.notify_one();
  }

  [[nodiscard]] std::size_t size() const noexcept {
    return workers_.size();
  }

  [[nodiscard]] bool on_worker_thread() const noexcept {
    return _thread_pool_detail::current_pool() == this;
  }

  // Runs one queued task on the calling thread. A worker that waits on work
  // it submitted to its own pool calls this instead of blocking.
  bool try_run_one() {
    std::function<void()> task;
    {
      std::scoped_lock lock(mutex_);
      if (queue_.empty()) {
        return false;
      }
      task = std::move(queue_.front());
      queue_.pop();
    }
    task();
    return true;
  }

 private:
  void worker_thread() {
    _thread_pool_detail::current_pool() = this;
    while (true) {
      std::function<void()> task;

      {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] -> bool { return stop_ || !queue_.empty(); });

        if (stop_ && queue_.empty()) {
          return;
        }

        task = std::move(queue_.front());
        queue_.pop();
      }

      task();
    }
  }

  std::vector<std::thread>          workers_;
  std::queue<std::function<void()>> queue_;
  std::condition_variable           cv_;
  std::mutex                        mutex_;
  bool                              stop_{false};
};

}  // namespace loom::primitives
