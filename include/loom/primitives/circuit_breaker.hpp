#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "clock.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// circuit_breaker - stops calling a primitive that keeps failing
// ============================================================================
//
//   closed    --(failure_threshold consecutive failures)-->  open
//   open      --(cooldown elapsed, next call is the trial)-->  half_open
//   half_open --(trial succeeds)-->  closed
//   half_open --(trial fails)-->     open
//
// While open, and while a half-open trial is in flight, calls are rejected
// with circuit_open_error without reaching the wrapped primitive.

enum class circuit_state { closed, open, half_open };

inline constexpr std::string_view to_string(circuit_state state) noexcept {
  switch (state) {
    case circuit_state::closed:
      return "closed";
    case circuit_state::open:
      return "open";
    case circuit_state::half_open:
      return "half_open";
  }
  return "unknown";
}

struct circuit_breaker_options {
  std::string                        name              = "circuit_breaker";
  std::size_t                        failure_threshold = 5;
  std::chrono::milliseconds          cooldown{60'000};
  std::shared_ptr<primitives::clock> clock;
  // Invoked after every state change, outside the breaker's lock.
  std::function<void(circuit_state from, circuit_state to)> on_transition;
  sink_ptr                                                   sink;
};

template <class In, class Out>
class circuit_breaker final : public primitive<In, Out> {
 public:
  circuit_breaker(primitive_ptr<In, Out> inner, circuit_breaker_options opts)
      : primitive<In, Out>(std::move(opts.name), std::move(opts.sink)),
        inner_(std::move(inner)),
        threshold_(opts.failure_threshold),
        cooldown_(opts.cooldown),
        clock_(opts.clock ? std::move(opts.clock) : default_clock()),
        on_transition_(std::move(opts.on_transition)) {
    if (!inner_) {
      throw configuration_error("circuit breaker '" + this->name() + "' wraps nothing");
    }
    if (threshold_ == 0) {
      throw configuration_error("circuit breaker '" + this->name()
                                + "' failure_threshold must be at least 1");
    }
    if (cooldown_.count() < 0) {
      throw configuration_error("circuit breaker '" + this->name() + "' cooldown is negative");
    }
  }

  [[nodiscard]] circuit_state state() const {
    std::scoped_lock lock(mutex_);
    return state_;
  }

  [[nodiscard]] std::size_t failure_count() const {
    std::scoped_lock lock(mutex_);
    return failures_;
  }

  void reset() {
    circuit_state previous;
    {
      std::scoped_lock lock(mutex_);
      previous         = state_;
      state_           = circuit_state::closed;
      failures_        = 0;
      trial_in_flight_ = false;
    }
    if (previous != circuit_state::closed) {
      announce(nullptr, previous, circuit_state::closed);
    }
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    const bool trial = admit(ctx);

    try {
      Out result = inner_->execute(std::move(input), ctx);
      record_success(trial, ctx);
      return result;
    } catch (...) {
      record_failure(trial, ctx);
      throw;
    }
  }

 private:
  struct transition {
    circuit_state from;
    circuit_state to;
  };

  // Returns whether this call is the half-open trial. Throws when rejected.
  bool admit(context& ctx) {
    std::optional<transition>    changed;
    std::optional<circuit_state> rejected;
    bool                         trial = false;
    {
      std::scoped_lock lock(mutex_);
      if (state_ == circuit_state::open && clock_->now() - opened_at_ >= cooldown_) {
        changed = transition{state_, circuit_state::half_open};
        state_  = circuit_state::half_open;
      }
      if (state_ == circuit_state::half_open && !trial_in_flight_) {
        trial_in_flight_ = true;
        trial            = true;
      } else if (state_ != circuit_state::closed) {
        rejected = state_;
      }
    }
    if (changed) {
      announce(&ctx, changed->from, changed->to);
    }
    if (rejected) {
      this->count("circuit_breaker.rejections");
      throw circuit_open_error("circuit breaker '" + this->name() + "' is "
                               + std::string(to_string(*rejected)));
    }
    return trial;
  }

  void record_success(bool trial, context& ctx) {
    std::optional<transition> changed;
    {
      std::scoped_lock lock(mutex_);
      failures_ = 0;
      if (trial) {
        trial_in_flight_ = false;
        changed          = transition{state_, circuit_state::closed};
        state_           = circuit_state::closed;
      }
    }
    if (changed) {
      announce(&ctx, changed->from, changed->to);
    }
  }

  void record_failure(bool trial, context& ctx) {
    std::optional<transition> changed;
    {
      std::scoped_lock lock(mutex_);
      if (trial) {
        trial_in_flight_ = false;
        changed          = transition{state_, circuit_state::open};
        state_           = circuit_state::open;
        opened_at_       = clock_->now();
      } else if (state_ == circuit_state::closed && ++failures_ >= threshold_) {
        changed    = transition{state_, circuit_state::open};
        state_     = circuit_state::open;
        opened_at_ = clock_->now();
      }
    }
    if (changed) {
      announce(&ctx, changed->from, changed->to);
    }
  }

  void announce(const context* ctx, circuit_state from, circuit_state to) {
    if (to == circuit_state::open) {
      logger()->warn("circuit breaker '{}' {} -> {}", this->name(), to_string(from), to_string(to));
    } else {
      logger()->info("circuit breaker '{}' {} -> {}", this->name(), to_string(from), to_string(to));
    }
    if (ctx != nullptr) {
      this->emit(*ctx, "circuit_transition",
                 {{"from", std::string(to_string(from))}, {"to", std::string(to_string(to))}});
    }
    if (on_transition_) {
      on_transition_(from, to);
    }
  }

  primitive_ptr<In, Out>                            inner_;
  std::size_t                                       threshold_;
  std::chrono::milliseconds                         cooldown_;
  std::shared_ptr<clock>                            clock_;
  std::function<void(circuit_state, circuit_state)> on_transition_;
  mutable std::mutex                                mutex_;
  circuit_state                                     state_           = circuit_state::closed;
  std::size_t                                       failures_        = 0;
  bool                                              trial_in_flight_ = false;
  clock::time_point                                 opened_at_{};
};

template <primitive_handle H>
auto with_circuit_breaker(H&& inner, circuit_breaker_options opts = {}) {
  using impl_t = circuit_breaker<input_of_t<H>, output_of_t<H>>;
  return std::make_shared<impl_t>(as_primitive(std::forward<H>(inner)), std::move(opts));
}

}  // namespace loom::primitives
