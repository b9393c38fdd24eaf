#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace loom::primitives {

// Time source owned by the primitives that need one (cache TTL, breaker
// cool-down, memory windows). Tests substitute manual_clock.
class clock {
 public:
  using duration   = std::chrono::steady_clock::duration;
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~clock() = default;

  [[nodiscard]] virtual time_point now() const noexcept = 0;

  // Wall-clock time, used for timestamps that leave the process (checkpoints,
  // memory records).
  [[nodiscard]] virtual std::chrono::system_clock::time_point wall_now() const noexcept = 0;
};

class steady_clock final : public clock {
 public:
  [[nodiscard]] time_point now() const noexcept override {
    return std::chrono::steady_clock::now();
  }

  [[nodiscard]] std::chrono::system_clock::time_point wall_now() const noexcept override {
    return std::chrono::system_clock::now();
  }
};

// Clock that only moves when told to.
class manual_clock final : public clock {
 public:
  manual_clock()
      : steady_origin_(std::chrono::steady_clock::now()),
        wall_origin_(std::chrono::system_clock::now()) {}

  [[nodiscard]] time_point now() const noexcept override {
    return steady_origin_ + offset();
  }

  [[nodiscard]] std::chrono::system_clock::time_point wall_now() const noexcept override {
    return wall_origin_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(offset());
  }

  template <class Rep, class Period>
  void advance(std::chrono::duration<Rep, Period> d) noexcept {
    offset_ns_.fetch_add(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count(),
                         std::memory_order_acq_rel);
  }

 private:
  [[nodiscard]] duration offset() const noexcept {
    return std::chrono::duration_cast<duration>(
        std::chrono::nanoseconds(offset_ns_.load(std::memory_order_acquire)));
  }

  time_point                            steady_origin_;
  std::chrono::system_clock::time_point wall_origin_;
  std::atomic<std::int64_t>             offset_ns_{0};
};

inline std::shared_ptr<clock> default_clock() {
  return std::make_shared<steady_clock>();
}

}  // namespace loom::primitives
