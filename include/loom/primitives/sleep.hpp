#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

namespace loom::this_thread {

// Sleeps for d unless stop is requested first. Returns false when woken by a
// stop request.
template <class Rep, class Period>
bool sleep_for(std::chrono::duration<Rep, Period> d, std::stop_token token) {
  if (d <= d.zero()) {
    return !token.stop_requested();
  }
  if (!token.stop_possible()) {
    std::this_thread::sleep_for(d);
    return true;
  }

  std::mutex                  mutex;
  std::condition_variable_any cv;
  std::unique_lock            lock(mutex);
  static_cast<void>(cv.wait_for(lock, token, d, [] -> bool { return false; }));
  return !token.stop_requested();
}

}  // namespace loom::this_thread
