#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "context.hpp"
#include "errors.hpp"
#include "instrumentation.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// instrumented - user callbacks around a primitive's execution
// ============================================================================

template <class In, class Out>
struct hooks {
  std::function<void(const In&, const context&)>                            on_entry;
  std::function<void(const Out&, const context&, std::chrono::nanoseconds)> on_exit;
  std::function<void(const std::exception_ptr&, const context&)>            on_error;
};

// Runs hooks around the wrapped primitive and records "<name>.start" and
// "<name>.end" checkpoints on the context. A throwing hook is logged and does
// not affect the result.
template <class In, class Out>
class instrumented final : public primitive<In, Out> {
 public:
  instrumented(primitive_ptr<In, Out> inner, hooks<In, Out> h, std::string name = {},
               sink_ptr sink = nullptr)
      : primitive<In, Out>(name.empty() && inner ? inner->name() + ".instrumented" : std::move(name),
                           std::move(sink)),
        inner_(std::move(inner)),
        hooks_(std::move(h)) {
    if (!inner_) {
      throw configuration_error("instrumented primitive wraps nothing");
    }
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    const auto start = std::chrono::steady_clock::now();
    ctx.checkpoint(inner_->name() + ".start");
    if (hooks_.on_entry) {
      _instrumentation_detail::guarded("on_entry", [&] -> void { hooks_.on_entry(input, ctx); });
    }

    try {
      Out result = inner_->execute(std::move(input), ctx);
      ctx.checkpoint(inner_->name() + ".end");
      if (hooks_.on_exit) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        _instrumentation_detail::guarded("on_exit",
                                         [&] -> void { hooks_.on_exit(result, ctx, elapsed); });
      }
      return result;
    } catch (...) {
      ctx.checkpoint(inner_->name() + ".end");
      if (hooks_.on_error) {
        auto error = std::current_exception();
        _instrumentation_detail::guarded("on_error", [&] -> void { hooks_.on_error(error, ctx); });
      }
      throw;
    }
  }

 private:
  primitive_ptr<In, Out> inner_;
  hooks<In, Out>         hooks_;
};

template <primitive_handle H>
auto instrument(H&& inner, hooks<input_of_t<H>, output_of_t<H>> h, sink_ptr sink = nullptr) {
  using impl_t = instrumented<input_of_t<H>, output_of_t<H>>;
  return as_primitive(std::make_shared<impl_t>(as_primitive(std::forward<H>(inner)), std::move(h),
                                               std::string{}, std::move(sink)));
}

}  // namespace loom::primitives
