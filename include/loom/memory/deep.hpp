#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "loom/primitives/clock.hpp"
#include "loom/primitives/errors.hpp"
#include "session.hpp"
#include "store.hpp"
#include "types.hpp"

namespace loom::memory {

// ============================================================================
// deep_memory - tagged, ranked long-term records
// ============================================================================

// Scores a record against a query; records scoring 0 or less are dropped.
using relevance_fn = std::function<double(std::string_view query, const memory_record& record)>;

struct deep_options {
  relevance_fn relevance = keyword_relevance;
  // How many candidates the store is asked for before ranking.
  std::size_t candidate_pool = 100;
  // Send the query text to the store so it can prefilter. Rankers that match
  // records without shared words (similarity search) should turn this off.
  bool                                     store_prefilter = true;
  std::optional<std::chrono::milliseconds> ttl;
};

class deep_memory final : public memory_layer {
 public:
  explicit deep_memory(std::shared_ptr<memory_store> store = nullptr, deep_options opts = {},
                       std::shared_ptr<clock> time = nullptr)
      : clock_(time ? std::move(time) : primitives::default_clock()),
        store_(store ? std::move(store) : std::make_shared<in_memory_store>(10'000, clock_)),
        opts_(std::move(opts)) {
    if (!opts_.relevance) {
      throw configuration_error("deep memory needs a relevance function");
    }
    if (opts_.candidate_pool == 0) {
      throw configuration_error("deep memory candidate_pool must be at least 1");
    }
  }

  void add(memory_record record) override {
    if (record.key.empty()) {
      throw primitives::validation_error("deep memory records need a key");
    }
    if (record.importance < 0.0 || record.importance > 1.0) {
      throw primitives::validation_error("importance of '" + record.key + "' is outside [0, 1]");
    }
    if (record.created_at == std::chrono::system_clock::time_point{}) {
      record.created_at = clock_->wall_now();
    }
    const std::string key = record.key;
    store_->add(key, std::move(record), opts_.ttl);
  }

  [[nodiscard]] std::optional<memory_record> get(const std::string& key) const override {
    return store_->get(key);
  }

  [[nodiscard]] std::vector<memory_record> search(const search_query& query) const override {
    const auto pool = std::max(query.limit, opts_.candidate_pool);
    auto candidates =
        store_->search(opts_.store_prefilter ? query.text : std::string{}, pool, query.filters);

    std::vector<std::pair<double, memory_record>> scored;
    scored.reserve(candidates.size());
    for (auto& record : candidates) {
      const double score = opts_.relevance(query.text, record);
      if (score > 0.0) {
        scored.emplace_back(score, std::move(record));
      }
    }
    return rank(std::move(scored), query.limit);
  }

  [[nodiscard]] validation_result validate(const std::string& key,
                                           const fact_value&  actual) const noexcept override {
    try {
      return presence_result("deep memory", key, store_->get(key).has_value(), actual);
    } catch (const std::exception& e) {
      validation_result result;
      result.key     = key;
      result.actual  = e.what();
      result.message = std::string("deep memory lookup failed: ") + e.what();
      return result;
    }
  }

  bool erase(const std::string& key) {
    return store_->erase(key);
  }

 private:
  std::shared_ptr<clock>        clock_;
  std::shared_ptr<memory_store> store_;
  deep_options                  opts_;
};

// ============================================================================
// window_memory - recent entries of the session and deep layers
// ============================================================================
//
// Not a store of its own: reads are filtered views over the layers it was
// given and writes go to the deep layer.
class window_memory final : public memory_layer {
 public:
  window_memory(std::shared_ptr<session_memory> session, std::shared_ptr<deep_memory> deep,
                std::chrono::system_clock::duration span, std::shared_ptr<clock> time = nullptr)
      : session_(std::move(session)),
        deep_(std::move(deep)),
        span_(span),
        clock_(time ? std::move(time) : primitives::default_clock()) {
    if (!session_ || !deep_) {
      throw configuration_error("window memory needs session and deep layers");
    }
    if (span_ <= span_.zero()) {
      throw configuration_error("window memory span must be positive");
    }
  }

  void add(memory_record record) override {
    deep_->add(std::move(record));
  }

  [[nodiscard]] std::optional<memory_record> get(const std::string& key) const override {
    auto record = deep_->get(key);
    if (record && record->created_at >= cutoff(span_)) {
      return record;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::vector<memory_record> search(const search_query& query) const override {
    return recent(query, span_);
  }

  // Same as search() with an explicit window instead of the configured one.
  [[nodiscard]] std::vector<memory_record> recent(const search_query&                  query,
                                                  std::chrono::system_clock::duration period) const {
    search_query bounded = query;
    const auto   from    = cutoff(period);
    if (!bounded.filters.since || *bounded.filters.since < from) {
      bounded.filters.since = from;
    }

    auto from_session = session_->search(bounded);
    auto from_deep    = deep_->search(bounded);

    std::vector<std::pair<double, memory_record>> merged;
    merged.reserve(from_session.size() + from_deep.size());
    for (auto& record : from_session) {
      merged.emplace_back(keyword_relevance(query.text, record), std::move(record));
    }
    for (auto& record : from_deep) {
      merged.emplace_back(keyword_relevance(query.text, record), std::move(record));
    }
    return rank(std::move(merged), query.limit);
  }

  [[nodiscard]] validation_result validate(const std::string& key,
                                           const fact_value&  actual) const noexcept override {
    try {
      return presence_result("memory window", key, get(key).has_value(), actual);
    } catch (const std::exception& e) {
      validation_result result;
      result.key     = key;
      result.message = std::string("memory window lookup failed: ") + e.what();
      return result;
    }
  }

  [[nodiscard]] std::chrono::system_clock::duration span() const noexcept {
    return span_;
  }

 private:
  [[nodiscard]] std::chrono::system_clock::time_point cutoff(
      std::chrono::system_clock::duration period) const {
    return clock_->wall_now() - period;
  }

  std::shared_ptr<session_memory>     session_;
  std::shared_ptr<deep_memory>        deep_;
  std::chrono::system_clock::duration span_;
  std::shared_ptr<clock>              clock_;
};

}  // namespace loom::memory
