#pragma once

#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace loom::primitives {

// ============================================================================
// Observability sink contract
// ============================================================================

using labels = std::map<std::string, std::string>;

enum class execution_status { success, failure };

inline constexpr std::string_view to_string(execution_status status) noexcept {
  return status == execution_status::success ? "success" : "failure";
}

// Identity of one primitive invocation.
struct span_record {
  std::string primitive;
  std::string correlation_id;
  std::string trace_id;
  std::string span_id;
  std::string parent_span_id;

  static span_record of(std::string primitive, const context& ctx) {
    return {std::move(primitive), ctx.correlation_id(), ctx.trace_id(), ctx.span_id(),
            ctx.parent_span_id()};
  }
};

struct span_outcome {
  execution_status         status = execution_status::success;
  std::chrono::nanoseconds duration{0};
  std::string              error;
};

class instrumentation_sink {
 public:
  virtual ~instrumentation_sink() = default;

  virtual void span_start(const span_record& span) = 0;
  virtual void span_end(const span_record& span, const span_outcome& outcome) = 0;
  virtual void event(const span_record& span, std::string_view name, const labels& attributes) = 0;
  virtual void counter(std::string_view name, double delta, const labels& attributes) = 0;
  virtual void histogram(std::string_view name, double value, const labels& attributes) = 0;
};

using sink_ptr = std::shared_ptr<instrumentation_sink>;

class noop_sink final : public instrumentation_sink {
 public:
  void span_start(const span_record& /*unused*/) override {}
  void span_end(const span_record& /*unused*/, const span_outcome& /*unused*/) override {}
  void event(const span_record& /*unused*/, std::string_view /*unused*/,
             const labels& /*unused*/) override {}
  void counter(std::string_view /*unused*/, double /*unused*/, const labels& /*unused*/) override {
  }
  void histogram(std::string_view /*unused*/, double /*unused*/,
                 const labels& /*unused*/) override {}
};

inline sink_ptr make_noop_sink() {
  return std::make_shared<noop_sink>();
}

// Forwards every record to each of its children in order.
class fanout_sink final : public instrumentation_sink {
 public:
  explicit fanout_sink(std::vector<sink_ptr> sinks) : sinks_(std::move(sinks)) {}

  void span_start(const span_record& span) override {
    for (auto& s : sinks_) {
      s->span_start(span);
    }
  }

  void span_end(const span_record& span, const span_outcome& outcome) override {
    for (auto& s : sinks_) {
      s->span_end(span, outcome);
    }
  }

  void event(const span_record& span, std::string_view name, const labels& attributes) override {
    for (auto& s : sinks_) {
      s->event(span, name, attributes);
    }
  }

  void counter(std::string_view name, double delta, const labels& attributes) override {
    for (auto& s : sinks_) {
      s->counter(name, delta, attributes);
    }
  }

  void histogram(std::string_view name, double value, const labels& attributes) override {
    for (auto& s : sinks_) {
      s->histogram(name, value, attributes);
    }
  }

 private:
  std::vector<sink_ptr> sinks_;
};

// Writes spans and events to the loom spdlog logger.
class logging_sink final : public instrumentation_sink {
 public:
  void span_start(const span_record& span) override {
    logger()->debug("{} started (correlation={}, span={})", span.primitive, span.correlation_id,
                    span.span_id);
  }

  void span_end(const span_record& span, const span_outcome& outcome) override {
    auto ms = std::chrono::duration<double, std::milli>(outcome.duration).count();
    if (outcome.status == execution_status::success) {
      logger()->debug("{} completed in {:.3f}ms (correlation={})", span.primitive, ms,
                      span.correlation_id);
    } else {
      logger()->warn("{} failed after {:.3f}ms: {} (correlation={})", span.primitive, ms,
                     outcome.error, span.correlation_id);
    }
  }

  void event(const span_record& span, std::string_view name, const labels& attributes) override {
    std::string rendered;
    for (const auto& [key, value] : attributes) {
      rendered += ' ';
      rendered += key;
      rendered += '=';
      rendered += value;
    }
    logger()->info("{} {}{} (correlation={})", span.primitive, name, rendered,
                   span.correlation_id);
  }

  void counter(std::string_view name, double delta, const labels& /*unused*/) override {
    logger()->trace("counter {} += {}", name, delta);
  }

  void histogram(std::string_view name, double value, const labels& /*unused*/) override {
    logger()->trace("histogram {} <- {}", name, value);
  }
};

// ============================================================================
// Guarded emission - sink failures never reach the primitive
// ============================================================================

namespace _instrumentation_detail {

template <class F>
void guarded(std::string_view what, F&& f) {
  try {
    std::forward<F>(f)();
  } catch (const std::exception& e) {
    logger()->warn("instrumentation sink failed during {}: {}", what, e.what());
  } catch (...) {
    logger()->warn("instrumentation sink failed during {}: unknown exception", what);
  }
}

}  // namespace _instrumentation_detail

}  // namespace loom::primitives
