#pragma once

#include <any>
#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// compensation - multi-step saga that undoes completed steps on failure
// ============================================================================
//
// Steps run in order like a sequential chain. When step k fails, the
// compensators of steps k-1 .. 0 run in that order, each receiving the output
// its step produced. A failing compensator is logged and recorded in the
// report; it never replaces the error that triggered the rollback, which is
// rethrown once compensation finishes.

struct compensation_failure {
  std::string step;
  std::string error;
};

struct compensation_report {
  std::string                       failed_step;
  std::string                       error;
  // Steps whose compensator completed, in the order they ran.
  std::vector<std::string>          compensated;
  std::vector<compensation_failure> failures;

  [[nodiscard]] bool fully_compensated() const noexcept {
    return failures.empty();
  }
};

inline constexpr const char* compensation_report_key = "compensation.report";

namespace _compensation_detail {

struct saga_step {
  std::string                                      name;
  std::function<std::any(std::any, context&)>     forward;
  std::function<void(const std::any&, context&)>  compensate;
};

}  // namespace _compensation_detail

template <class In, class Out>
class compensation final : public primitive<In, Out> {
 public:
  using step = _compensation_detail::saga_step;

  compensation(std::string name, std::vector<step> steps, sink_ptr sink = nullptr)
      : primitive<In, Out>(std::move(name), std::move(sink)), steps_(std::move(steps)) {
    if (steps_.empty()) {
      throw configuration_error("compensation '" + this->name() + "' has no steps");
    }
  }

  [[nodiscard]] std::size_t size() const noexcept {
    return steps_.size();
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    std::vector<std::any> outputs;
    outputs.reserve(steps_.size());

    std::any current(std::move(input));
    for (std::size_t i = 0; i < steps_.size(); ++i) {
      try {
        outputs.push_back(steps_[i].forward(std::move(current), ctx));
      } catch (...) {
        roll_back(i, outputs, std::current_exception(), ctx);
        throw;
      }
      current = outputs.back();
    }
    return std::any_cast<Out>(std::move(current));
  }

 private:
  void roll_back(std::size_t failed, const std::vector<std::any>& outputs,
                 const std::exception_ptr& cause, context& ctx) {
    compensation_report report;
    report.failed_step = steps_[failed].name;
    report.error       = describe(cause);

    logger()->warn("{} step '{}' failed, compensating {} completed step(s): {}", this->name(),
                   report.failed_step, outputs.size(), report.error);

    for (std::size_t i = outputs.size(); i-- > 0;) {
      const auto& s = steps_[i];
      if (!s.compensate) {
        continue;
      }
      try {
        s.compensate(outputs[i], ctx);
        report.compensated.push_back(s.name);
      } catch (...) {
        auto reason = describe(std::current_exception());
        logger()->error("{} compensator for '{}' failed: {}", this->name(), s.name, reason);
        report.failures.push_back({s.name, std::move(reason)});
      }
    }

    this->emit(ctx, "compensated",
               {{"failed_step", report.failed_step},
                {"compensated", std::to_string(report.compensated.size())},
                {"compensation_failures", std::to_string(report.failures.size())}});
    ctx.state().set(compensation_report_key, std::move(report));
  }

  std::vector<step> steps_;
};

// ============================================================================
// saga_builder - typed construction of a compensation chain
// ============================================================================
//
//   auto booking = saga<order>("booking")
//                      .step(reserve, release)
//                      .step(charge, refund)
//                      .build();

template <class In, class Cur>
class saga_builder {
 public:
  saga_builder(std::string name, sink_ptr sink,
               std::vector<_compensation_detail::saga_step> steps = {})
      : name_(std::move(name)), sink_(std::move(sink)), steps_(std::move(steps)) {}

  // Step without an undo action.
  template <class Out>
  saga_builder<In, Out> step(primitive_ptr<Cur, Out> forward) && {
    return std::move(*this).template push<Out>(std::move(forward), {});
  }

  template <class Out>
  saga_builder<In, Out> step(primitive_ptr<Cur, Out> forward, primitive_ptr<Out, unit> undo) && {
    if (!undo) {
      throw configuration_error("compensator for '" + forward->name() + "' is null");
    }
    return std::move(*this).template push<Out>(
        std::move(forward), [undo = std::move(undo)](const std::any& output, context& ctx) -> void {
          undo->execute(std::any_cast<Out>(output), ctx);
        });
  }

  template <class Out, class F>
    requires std::invocable<F&, const Out&, context&>
  saga_builder<In, Out> step(primitive_ptr<Cur, Out> forward, F undo) && {
    return std::move(*this).template push<Out>(
        std::move(forward), [undo = std::move(undo)](const std::any& output, context& ctx) mutable -> void {
          std::invoke(undo, std::any_cast<const Out&>(output), ctx);
        });
  }

  [[nodiscard]] primitive_ptr<In, Cur> build() && {
    return as_primitive(
        std::make_shared<compensation<In, Cur>>(std::move(name_), std::move(steps_), std::move(sink_)));
  }

 private:
  template <class, class>
  friend class saga_builder;

  template <class Out>
  saga_builder<In, Out> push(primitive_ptr<Cur, Out>                        forward,
                             std::function<void(const std::any&, context&)> undo) && {
    if (!forward) {
      throw configuration_error("saga step is null");
    }
    std::string step_name = forward->name();
    steps_.push_back({std::move(step_name),
                      [forward = std::move(forward)](std::any input, context& ctx) -> std::any {
                        return std::any(forward->execute(std::any_cast<Cur>(std::move(input)), ctx));
                      },
                      std::move(undo)});
    return saga_builder<In, Out>(std::move(name_), std::move(sink_), std::move(steps_));
  }

  std::string                                  name_;
  sink_ptr                                     sink_;
  std::vector<_compensation_detail::saga_step> steps_;
};

template <class In>
saga_builder<In, In> saga(std::string name = "compensation", sink_ptr sink = nullptr) {
  return saga_builder<In, In>(std::move(name), std::move(sink));
}

}  // namespace loom::primitives
