#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <variant>

#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// timeout - bounds how long the caller waits for the wrapped primitive
// ============================================================================
//
// The wrapped primitive runs on its own thread with a context that shares the
// caller's state but observes a separate stop token. On expiry the token is
// signalled and the caller stops waiting. Running work is not interrupted:
// primitives that ignore their stop token keep running and their late result
// is discarded.

struct timeout_options {
  std::string               name = "timeout";
  std::chrono::milliseconds limit{30'000};
  sink_ptr                  sink;
};

namespace _timeout_detail {

template <class Out>
struct call_state {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    done = false;
  std::optional<Out>      value;
  std::exception_ptr      error;
  std::stop_source        stop;
};

}  // namespace _timeout_detail

template <class In, class Out>
class timeout_primitive final : public primitive<In, Out> {
 public:
  using fallback_type = std::variant<std::monostate, Out, primitive_ptr<In, Out>>;

  timeout_primitive(primitive_ptr<In, Out> inner, timeout_options opts,
                    fallback_type fallback = {})
      : primitive<In, Out>(std::move(opts.name), std::move(opts.sink)),
        inner_(std::move(inner)),
        limit_(opts.limit),
        fallback_(std::move(fallback)) {
    if (!inner_) {
      throw configuration_error("timeout '" + this->name() + "' wraps nothing");
    }
    if (limit_.count() <= 0) {
      throw configuration_error("timeout '" + this->name() + "' limit must be positive");
    }
    if (auto* fb = std::get_if<2>(&fallback_); fb != nullptr && !*fb) {
      throw configuration_error("timeout '" + this->name() + "' fallback primitive is null");
    }
  }

  [[nodiscard]] std::chrono::milliseconds limit() const noexcept {
    return limit_;
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    auto state = std::make_shared<_timeout_detail::call_state<Out>>();
    std::stop_callback<_context_detail::forward_stop> link(
        ctx.stop_token(), _context_detail::forward_stop{state->stop});

    std::optional<In> kept;
    if (fallback_.index() == 2) {
      kept.emplace(input);
    }

    auto op_ctx = std::make_shared<context>(ctx.linked(state->stop.get_token()));
    std::thread([state, inner = inner_, op_ctx, input = std::move(input)] mutable -> void {
      try {
        auto value = inner->execute(std::move(input), *op_ctx);
        std::scoped_lock lock(state->mutex);
        state->value = std::move(value);
        state->done  = true;
      } catch (...) {
        std::scoped_lock lock(state->mutex);
        state->error = std::current_exception();
        state->done  = true;
      }
      state->cv.notify_all();
    }).detach();

    {
      std::unique_lock lock(state->mutex);
      if (state->cv.wait_for(lock, limit_, [&] -> bool { return state->done; })) {
        if (state->error) {
          std::rethrow_exception(state->error);
        }
        return std::move(*state->value);
      }
    }

    state->stop.request_stop();
    logger()->warn("{} expired after {}ms", this->name(), limit_.count());
    this->emit(ctx, "timeout", {{"limit_ms", std::to_string(limit_.count())}});
    this->count("timeout.expired");

    if (auto* value = std::get_if<1>(&fallback_)) {
      return *value;
    }
    if (auto* fb = std::get_if<2>(&fallback_)) {
      return (*fb)->execute(std::move(*kept), ctx);
    }
    throw timeout_error("'" + this->name() + "' exceeded " + std::to_string(limit_.count())
                        + "ms");
  }

 private:
  primitive_ptr<In, Out>    inner_;
  std::chrono::milliseconds limit_;
  fallback_type             fallback_;
};

template <primitive_handle H>
auto timeout(H&& inner, timeout_options opts) {
  using impl_t = timeout_primitive<input_of_t<H>, output_of_t<H>>;
  return as_primitive(
      std::make_shared<impl_t>(as_primitive(std::forward<H>(inner)), std::move(opts)));
}

// On expiry runs `fallback` on the same input instead of raising.
template <primitive_handle H>
auto timeout(H&& inner, timeout_options opts,
             primitive_ptr<input_of_t<H>, output_of_t<H>> fallback) {
  using impl_t = timeout_primitive<input_of_t<H>, output_of_t<H>>;
  return as_primitive(std::make_shared<impl_t>(
      as_primitive(std::forward<H>(inner)), std::move(opts),
      typename impl_t::fallback_type(std::in_place_index<2>, std::move(fallback))));
}

// On expiry returns `value` instead of raising.
template <primitive_handle H>
auto timeout_or(H&& inner, timeout_options opts, output_of_t<H> value) {
  using impl_t = timeout_primitive<input_of_t<H>, output_of_t<H>>;
  return as_primitive(std::make_shared<impl_t>(
      as_primitive(std::forward<H>(inner)), std::move(opts),
      typename impl_t::fallback_type(std::in_place_index<1>, std::move(value))));
}

}  // namespace loom::primitives
