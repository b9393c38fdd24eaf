#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "instrumentation.hpp"

namespace loom::primitives {

// ============================================================================
// metrics_sink - in-process aggregation of counters and histograms
// ============================================================================
//
// Series are keyed by name and labels, rendered as name{k=v,k=v} with labels
// in key order, e.g. primitive.executions{primitive=fetch,status=success}.

struct histogram_summary {
  std::uint64_t count = 0;
  double        sum   = 0.0;
  double        min   = std::numeric_limits<double>::infinity();
  double        max   = -std::numeric_limits<double>::infinity();

  [[nodiscard]] double mean() const noexcept {
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
  }
};

struct metrics_snapshot {
  std::map<std::string, double>            counters;
  std::map<std::string, histogram_summary> histograms;
  std::int64_t                             active_spans = 0;
};

inline std::string series_key(std::string_view name, const labels& attributes) {
  std::string key(name);
  if (attributes.empty()) {
    return key;
  }
  key += '{';
  bool first = true;
  for (const auto& [k, v] : attributes) {
    if (!first) {
      key += ',';
    }
    first = false;
    key += k;
    key += '=';
    key += v;
  }
  key += '}';
  return key;
}

class metrics_sink final : public instrumentation_sink {
 public:
  void span_start(const span_record& /*unused*/) override {
    std::scoped_lock lock(mutex_);
    ++active_spans_;
  }

  void span_end(const span_record& /*unused*/, const span_outcome& /*unused*/) override {
    std::scoped_lock lock(mutex_);
    --active_spans_;
  }

  void event(const span_record& span, std::string_view name, const labels& /*unused*/) override {
    std::scoped_lock lock(mutex_);
    counters_[series_key("events", {{"event", std::string(name)}, {"primitive", span.primitive}})] +=
        1.0;
  }

  void counter(std::string_view name, double delta, const labels& attributes) override {
    auto key = series_key(name, attributes);
    std::scoped_lock lock(mutex_);
    counters_[key] += delta;
  }

  void histogram(std::string_view name, double value, const labels& attributes) override {
    auto key = series_key(name, attributes);
    std::scoped_lock lock(mutex_);
    auto& h = histograms_[key];
    ++h.count;
    h.sum += value;
    h.min = std::min(h.min, value);
    h.max = std::max(h.max, value);
  }

  [[nodiscard]] double counter_value(std::string_view name, const labels& attributes = {}) const {
    auto key = series_key(name, attributes);
    std::scoped_lock lock(mutex_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0.0 : it->second;
  }

  [[nodiscard]] histogram_summary histogram_value(std::string_view name,
                                                  const labels&    attributes = {}) const {
    auto key = series_key(name, attributes);
    std::scoped_lock lock(mutex_);
    auto it = histograms_.find(key);
    return it == histograms_.end() ? histogram_summary{} : it->second;
  }

  [[nodiscard]] metrics_snapshot snapshot() const {
    std::scoped_lock lock(mutex_);
    return {counters_, histograms_, active_spans_};
  }

  void reset() {
    std::scoped_lock lock(mutex_);
    counters_.clear();
    histograms_.clear();
  }

 private:
  mutable std::mutex                       mutex_;
  std::map<std::string, double>            counters_;
  std::map<std::string, histogram_summary> histograms_;
  std::int64_t                             active_spans_ = 0;
};

}  // namespace loom::primitives
