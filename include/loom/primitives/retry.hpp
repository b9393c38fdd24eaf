#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>

#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "primitive.hpp"
#include "sleep.hpp"

namespace loom::primitives {

// ============================================================================
// retry - re-invokes the wrapped primitive with backoff between attempts
// ============================================================================

enum class backoff_strategy { exponential, linear, fixed };

struct retry_policy {
  std::string name = "retry";
  // Additional attempts after the first one.
  std::size_t               max_retries = 3;
  backoff_strategy          strategy    = backoff_strategy::exponential;
  std::chrono::milliseconds base_delay{100};
  std::chrono::milliseconds max_delay{30'000};
  double                    multiplier = 2.0;
  // Scales each delay by a factor drawn from [0.5, 1.5).
  bool jitter = false;
  // Decides whether a failure is worth another attempt.
  std::function<bool(const std::exception_ptr&)> retryable = is_retryable;
  sink_ptr                                       sink;

  void validate() const {
    if (base_delay.count() < 0 || max_delay.count() < 0) {
      throw configuration_error("retry delays must not be negative");
    }
    if (max_delay < base_delay) {
      throw configuration_error("retry max_delay is shorter than base_delay");
    }
    if (strategy == backoff_strategy::exponential && multiplier < 1.0) {
      throw configuration_error("retry multiplier must be at least 1");
    }
    if (!retryable) {
      throw configuration_error("retry predicate is empty");
    }
  }

  // Delay before retry number `retry` (1 for the first retry; 0 counts as 1).
  [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t retry) const {
    retry     = std::max<std::size_t>(retry, 1);
    double ms = static_cast<double>(base_delay.count());
    switch (strategy) {
      case backoff_strategy::exponential:
        ms *= std::pow(multiplier, static_cast<double>(retry - 1));
        break;
      case backoff_strategy::linear:
        ms *= static_cast<double>(retry);
        break;
      case backoff_strategy::fixed:
        break;
    }
    if (jitter) {
      thread_local std::mt19937_64            engine{std::random_device{}()};
      std::uniform_real_distribution<double> factor(0.5, 1.5);
      ms *= factor(engine);
    }
    ms = std::min(ms, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
  }
};

template <class In, class Out>
class retry_primitive final : public primitive<In, Out> {
 public:
  retry_primitive(primitive_ptr<In, Out> inner, retry_policy policy)
      : primitive<In, Out>(std::move(policy.name), std::move(policy.sink)),
        inner_(std::move(inner)),
        policy_(std::move(policy)) {
    if (!inner_) {
      throw configuration_error("retry '" + this->name() + "' wraps nothing");
    }
    policy_.validate();
  }

  [[nodiscard]] const retry_policy& policy() const noexcept {
    return policy_;
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    const std::size_t max_attempts = policy_.max_retries + 1;

    for (std::size_t attempt = 1;; ++attempt) {
      try {
        return inner_->execute(In(input), ctx);
      } catch (...) {
        auto error = std::current_exception();

        if (attempt >= max_attempts) {
          logger()->error("{} exhausted {} attempts: {}", this->name(), attempt, describe(error));
          give_up(attempt, ctx);
        }
        if (!policy_.retryable(error)) {
          logger()->debug("{} not retrying non-retryable failure: {}", this->name(),
                          describe(error));
          give_up(attempt, ctx);
        }

        const auto delay = policy_.delay_for(attempt);
        logger()->warn("{} attempt {}/{} failed, retrying in {}ms: {}", this->name(), attempt,
                       max_attempts, delay.count(), describe(error));
        this->emit(ctx, "retry", {{"attempt", std::to_string(attempt)},
                                  {"delay_ms", std::to_string(delay.count())}});
        this->count("retry.attempts");

        if (!loom::this_thread::sleep_for(delay, ctx.stop_token())) {
          logger()->info("{} cancelled while backing off", this->name());
          give_up(attempt, ctx);
        }
      }
    }
  }

 private:
  // Rethrows the in-flight exception carrying the attempt count. Must be
  // called from inside a handler.
  [[noreturn]] static void give_up(std::size_t attempts, context& ctx) {
    ctx.state().set("retry.attempts", attempts);
    try {
      throw;
    } catch (error& e) {
      e.annotate_attempts(attempts);
      throw;
    }
  }

  primitive_ptr<In, Out> inner_;
  retry_policy           policy_;
};

template <primitive_handle H>
auto retry(H&& inner, retry_policy policy = {}) {
  using impl_t = retry_primitive<input_of_t<H>, output_of_t<H>>;
  return as_primitive(
      std::make_shared<impl_t>(as_primitive(std::forward<H>(inner)), std::move(policy)));
}

}  // namespace loom::primitives
