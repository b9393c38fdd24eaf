#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "context.hpp"
#include "errors.hpp"
#include "primitive.hpp"
#include "thread_pool.hpp"

namespace loom::primitives {

// ============================================================================
// parallel - concurrent branches over one input
// ============================================================================
//
// Every branch receives its own copy of the input and a child context (own
// state, same correlation). Results are returned in branch order.
//
//   fail_fast: the first failure requests stop on the remaining branches and
//              is rethrown immediately; late results are discarded.
//   settled:   every branch runs to completion, one outcome per branch.

enum class parallel_mode { fail_fast, settled };

template <class T>
using outcome = std::expected<T, std::exception_ptr>;

struct parallel_options {
  std::string name = "parallel";
  // Pool the branches run on. When empty, each parallel instance creates its
  // own pool sized to its branch count on first execution.
  std::shared_ptr<thread_pool> pool;
  sink_ptr                     sink;
};

namespace _parallel_detail {

// Shared between the caller and the branch tasks. Branches that finish after
// a fail-fast caller has returned still write here safely.
template <class Out>
struct gather_state {
  explicit gather_state(std::size_t n) : remaining(n), values(n), errors(n) {}

  void complete(std::size_t index, Out value) {
    {
      std::scoped_lock lock(mutex);
      values[index] = std::move(value);
      --remaining;
    }
    cv.notify_all();
  }

  void fail(std::size_t index, std::exception_ptr error, bool stop_others) {
    {
      std::scoped_lock lock(mutex);
      errors[index] = error;
      if (!first_error) {
        first_error = error;
      }
      --remaining;
    }
    if (stop_others) {
      stop.request_stop();
    }
    cv.notify_all();
  }

  std::mutex                       mutex;
  std::condition_variable          cv;
  std::size_t                      remaining;
  std::vector<std::optional<Out>>  values;
  std::vector<std::exception_ptr>  errors;
  std::exception_ptr               first_error;
  std::stop_source                 stop;
};

}  // namespace _parallel_detail

template <class In, class Out, parallel_mode Mode = parallel_mode::fail_fast>
class parallel final
    : public primitive<In, std::conditional_t<Mode == parallel_mode::fail_fast, std::vector<Out>,
                                              std::vector<outcome<Out>>>> {
 public:
  using result_type = std::conditional_t<Mode == parallel_mode::fail_fast, std::vector<Out>,
                                         std::vector<outcome<Out>>>;

  static constexpr bool fail_fast = Mode == parallel_mode::fail_fast;

  explicit parallel(std::vector<primitive_ptr<In, Out>> branches, parallel_options opts = {})
      : primitive<In, result_type>(std::move(opts.name), std::move(opts.sink)),
        branches_(std::move(branches)),
        pool_(std::move(opts.pool)) {
    if (branches_.empty()) {
      throw configuration_error("parallel '" + this->name() + "' has no branches");
    }
    for (const auto& branch : branches_) {
      if (!branch) {
        throw configuration_error("parallel '" + this->name() + "' has a null branch");
      }
    }
  }

  [[nodiscard]] const std::vector<primitive_ptr<In, Out>>& branches() const noexcept {
    return branches_;
  }

 protected:
  result_type do_execute(In input, context& ctx) override {
    const std::size_t n     = branches_.size();
    auto              state = std::make_shared<_parallel_detail::gather_state<Out>>(n);

    // Cancelling the caller cancels every branch.
    std::stop_callback<_context_detail::forward_stop> link(
        ctx.stop_token(), _context_detail::forward_stop{state->stop});

    auto& pool = workers();
    for (std::size_t i = 0; i < n; ++i) {
      auto child = std::make_shared<context>(ctx.create_child(state->stop.get_token()));
      pool.submit([state, branch = branches_[i], i, input, child] mutable -> void {
        if constexpr (fail_fast) {
          if (state->stop.stop_requested()) {
            state->fail(i, std::make_exception_ptr(operation_error("branch cancelled")), false);
            return;
          }
        }
        try {
          state->complete(i, branch->execute(std::move(input), *child));
        } catch (...) {
          state->fail(i, std::current_exception(), fail_fast);
        }
      });
    }

    auto finished = [&] -> bool {
      return state->remaining == 0 || (fail_fast && state->first_error);
    };

    std::unique_lock lock(state->mutex);
    if (pool.on_worker_thread()) {
      // Nested on our own pool: drain queued work so the branches can start.
      while (!finished()) {
        lock.unlock();
        if (!pool.try_run_one()) {
          lock.lock();
          state->cv.wait_for(lock, std::chrono::milliseconds(1), finished);
          continue;
        }
        lock.lock();
      }
    }

    if constexpr (fail_fast) {
      state->cv.wait(lock, finished);
      if (state->first_error) {
        auto error   = state->first_error;
        auto pending = state->remaining;
        lock.unlock();
        this->emit(ctx, "fail_fast", {{"pending_branches", std::to_string(pending)}});
        std::rethrow_exception(error);
      }

      result_type results;
      results.reserve(n);
      for (auto& value : state->values) {
        results.push_back(std::move(*value));
      }
      return results;
    } else {
      state->cv.wait(lock, finished);

      result_type results;
      results.reserve(n);
      for (std::size_t i = 0; i < n; ++i) {
        if (state->errors[i]) {
          results.emplace_back(std::unexpect, state->errors[i]);
        } else {
          results.emplace_back(std::move(*state->values[i]));
        }
      }
      return results;
    }
  }

 private:
  thread_pool& workers() {
    std::call_once(pool_once_, [this] -> void {
      if (!pool_) {
        pool_ = std::make_shared<thread_pool>(branches_.size());
      }
    });
    return *pool_;
  }

  std::vector<primitive_ptr<In, Out>> branches_;
  std::shared_ptr<thread_pool>        pool_;
  std::once_flag                      pool_once_;
};

template <class In, class Out>
using parallel_settled = parallel<In, Out, parallel_mode::settled>;

// parallel_of(a, b, c) runs a, b and c concurrently on the same input.
template <parallel_mode Mode = parallel_mode::fail_fast, primitive_handle First,
          primitive_handle... Rest>
  requires(std::same_as<input_of_t<First>, input_of_t<Rest>> && ...)
          && (std::same_as<output_of_t<First>, output_of_t<Rest>> && ...)
auto parallel_of(First&& first, Rest&&... rest) {
  using in_t  = input_of_t<First>;
  using out_t = output_of_t<First>;

  std::vector<primitive_ptr<in_t, out_t>> branches;
  branches.reserve(1 + sizeof...(Rest));
  branches.push_back(as_primitive(std::forward<First>(first)));
  (branches.push_back(as_primitive(std::forward<Rest>(rest))), ...);
  return as_primitive(std::make_shared<parallel<in_t, out_t, Mode>>(std::move(branches)));
}

template <class In, class Out>
primitive_ptr<In, std::vector<Out>> operator|(const primitive_ptr<In, Out>& a,
                                              const primitive_ptr<In, Out>& b) {
  return parallel_of(a, b);
}

// Extends a fail-fast group with one more branch instead of nesting it.
template <class In, class Out>
primitive_ptr<In, std::vector<Out>> operator|(const primitive_ptr<In, std::vector<Out>>& group,
                                              const primitive_ptr<In, Out>&              b) {
  auto existing = std::dynamic_pointer_cast<parallel<In, Out>>(group);
  if (!existing) {
    throw configuration_error("left operand of '|' is not a parallel group");
  }
  auto branches = existing->branches();
  branches.push_back(b);
  return as_primitive(std::make_shared<parallel<In, Out>>(std::move(branches)));
}

}  // namespace loom::primitives
