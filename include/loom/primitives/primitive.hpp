#pragma once

#include <chrono>
#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "context.hpp"
#include "errors.hpp"
#include "instrumentation.hpp"

namespace loom::primitives {

// Output of primitives that produce nothing.
using unit = std::monostate;

// ============================================================================
// primitive - the execute(input, context) contract
// ============================================================================
//
// Leaves, combinators and decorators all derive from this one interface.
// execute() is the instrumented boundary; implementations override
// do_execute(). Errors propagate unchanged: nothing here retries, times out
// or swallows.
template <class In, class Out>
class primitive {
  static_assert(!std::is_void_v<Out>, "primitives without a result return loom::primitives::unit");

 public:
  using input_type  = In;
  using output_type = Out;

  virtual ~primitive() = default;

  primitive(const primitive&)            = delete;
  primitive& operator=(const primitive&) = delete;

  Out execute(In input, context& ctx) {
    const auto span  = span_record::of(name_, ctx);
    const auto start = std::chrono::steady_clock::now();
    _instrumentation_detail::guarded("span_start", [&] -> void { sink_->span_start(span); });

    try {
      Out result = do_execute(std::move(input), ctx);
      finish(span, start, execution_status::success, {});
      return result;
    } catch (...) {
      finish(span, start, execution_status::failure, describe(std::current_exception()));
      throw;
    }
  }

  [[nodiscard]] const std::string& name() const noexcept {
    return name_;
  }

  [[nodiscard]] const sink_ptr& sink() const noexcept {
    return sink_;
  }

  // Replaces the sink. Not synchronized with concurrent execute() calls.
  void attach_sink(sink_ptr sink) {
    sink_ = sink ? std::move(sink) : make_noop_sink();
  }

 protected:
  explicit primitive(std::string name, sink_ptr sink = nullptr)
      : name_(std::move(name)), sink_(sink ? std::move(sink) : make_noop_sink()) {}

  virtual Out do_execute(In input, context& ctx) = 0;

  void emit(const context& ctx, std::string_view event, const labels& attributes = {}) const {
    _instrumentation_detail::guarded("event", [&] -> void {
      sink_->event(span_record::of(name_, ctx), event, attributes);
    });
  }

  void count(std::string_view metric, double delta = 1.0) const {
    _instrumentation_detail::guarded("counter", [&] -> void {
      sink_->counter(metric, delta, {{"primitive", name_}});
    });
  }

 private:
  void finish(const span_record& span, std::chrono::steady_clock::time_point start,
              execution_status status, std::string error) const {
    span_outcome outcome{status, std::chrono::steady_clock::now() - start, std::move(error)};
    _instrumentation_detail::guarded("span_end", [&] -> void {
      sink_->span_end(span, outcome);
      const labels attributes{{"primitive", name_}, {"status", std::string(to_string(status))}};
      sink_->counter("primitive.executions", 1.0, attributes);
      sink_->histogram("primitive.duration_ms",
                       std::chrono::duration<double, std::milli>(outcome.duration).count(),
                       attributes);
    });
  }

  std::string name_;
  sink_ptr    sink_;
};

template <class In, class Out>
using primitive_ptr = std::shared_ptr<primitive<In, Out>>;

// ============================================================================
// Concepts over primitive handles
// ============================================================================

template <class P>
concept primitive_type = requires {
  typename P::input_type;
  typename P::output_type;
} && std::derived_from<P, primitive<typename P::input_type, typename P::output_type>>;

template <class H>
concept primitive_handle = requires { typename std::remove_cvref_t<H>::element_type; }
                           && primitive_type<typename std::remove_cvref_t<H>::element_type>;

template <primitive_handle H>
using input_of_t = typename std::remove_cvref_t<H>::element_type::input_type;

template <primitive_handle H>
using output_of_t = typename std::remove_cvref_t<H>::element_type::output_type;

// Upcasts any handle to the shared base type.
template <primitive_handle H>
primitive_ptr<input_of_t<H>, output_of_t<H>> as_primitive(H&& handle) {
  return primitive_ptr<input_of_t<H>, output_of_t<H>>(std::forward<H>(handle));
}

// ============================================================================
// lambda - wraps a callable as a leaf primitive
// ============================================================================

namespace _lambda_detail {

template <class F, class In>
concept takes_context = std::invocable<F&, In, context&>;

template <class F, class In>
using result_t = typename std::conditional_t<takes_context<F, In>, std::invoke_result<F&, In, context&>,
                                             std::invoke_result<F&, In>>::type;

}  // namespace _lambda_detail

template <class In, class F>
class lambda_primitive final : public primitive<In, _lambda_detail::result_t<F, In>> {
  using base = primitive<In, _lambda_detail::result_t<F, In>>;

 public:
  lambda_primitive(F fn, std::string name, sink_ptr sink)
      : base(std::move(name), std::move(sink)), fn_(std::move(fn)) {}

 protected:
  typename base::output_type do_execute(In input, context& ctx) override {
    if constexpr (_lambda_detail::takes_context<F, In>) {
      return std::invoke(fn_, std::move(input), ctx);
    } else {
      return std::invoke(fn_, std::move(input));
    }
  }

 private:
  F fn_;
};

template <class In>
struct lambda_t {
  template <class F>
    requires std::invocable<std::decay_t<F>&, In, context&> || std::invocable<std::decay_t<F>&, In>
  auto operator()(F&& fn, std::string name = "lambda", sink_ptr sink = nullptr) const {
    using impl_t = lambda_primitive<In, std::decay_t<F>>;
    return as_primitive(
        std::make_shared<impl_t>(std::forward<F>(fn), std::move(name), std::move(sink)));
  }
};

template <class In>
inline constexpr lambda_t<In> lambda{};

}  // namespace loom::primitives
