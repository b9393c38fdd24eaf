#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "loom/primitives/errors.hpp"
#include "store.hpp"
#include "types.hpp"

namespace loom::memory {

// ============================================================================
// Permanent architectural facts
// ============================================================================
//
// A fact states a requirement ("test-coverage >= 80") that external values are
// checked against. Facts are registered once; the only later change allowed is
// deprecation, which keeps the fact but makes every validation against it fail
// with a warning.

enum class fact_status { active, deprecated };

enum class constraint_op { eq, ne, ge, gt, le, lt, one_of };

inline constexpr std::string_view to_string(constraint_op op) noexcept {
  switch (op) {
    case constraint_op::eq:
      return "==";
    case constraint_op::ne:
      return "!=";
    case constraint_op::ge:
      return ">=";
    case constraint_op::gt:
      return ">";
    case constraint_op::le:
      return "<=";
    case constraint_op::lt:
      return "<";
    case constraint_op::one_of:
      return "one of";
  }
  return "?";
}

// Custom check; returns an error message, or nullopt when `actual` passes.
using fact_validator = std::function<std::optional<std::string>(const fact_value& actual)>;

struct fact {
  std::string             key;
  // Expected value, or the bound for ordered constraints.
  fact_value              value;
  std::string             category;
  std::string             rationale;
  constraint_op           op = constraint_op::eq;
  // Accepted values for constraint_op::one_of.
  std::vector<fact_value> options;
  // Replaces the constraint check when set.
  fact_validator          validator;
  fact_status             status = fact_status::active;
  std::string             deprecation_reason;

  [[nodiscard]] std::string expectation() const {
    if (validator) {
      return fmt::format("custom check ({})", render(value));
    }
    if (op == constraint_op::one_of) {
      std::string out = "one of [";
      for (std::size_t i = 0; i < options.size(); ++i) {
        out += (i == 0 ? "" : ", ") + render(options[i]);
      }
      return out + "]";
    }
    return fmt::format("{} {}", to_string(op), render(value));
  }
};

struct fact_summary {
  std::size_t                        total      = 0;
  std::size_t                        active     = 0;
  std::size_t                        deprecated = 0;
  std::map<std::string, std::size_t> by_category;
};

namespace _facts_detail {

inline std::optional<double> as_number(const fact_value& v) {
  if (const auto* i = std::get_if<std::int64_t>(&v)) {
    return static_cast<double>(*i);
  }
  if (const auto* d = std::get_if<double>(&v)) {
    return *d;
  }
  return std::nullopt;
}

// Three-way comparison of actual against expected. Numbers compare across
// integer and floating point; other types only against their own type.
inline std::optional<int> compare(const fact_value& actual, const fact_value& expected) {
  auto a = as_number(actual);
  auto e = as_number(expected);
  if (a && e) {
    return *a < *e ? -1 : (*a > *e ? 1 : 0);
  }
  if (actual.index() != expected.index()) {
    return std::nullopt;
  }
  if (const auto* s = std::get_if<std::string>(&actual)) {
    return s->compare(std::get<std::string>(expected)) < 0 ? -1
           : *s == std::get<std::string>(expected)         ? 0
                                                           : 1;
  }
  const bool x = std::get<bool>(actual);
  const bool y = std::get<bool>(expected);
  return x == y ? 0 : (x ? 1 : -1);
}

inline bool ordered(const fact_value& v) {
  return !std::holds_alternative<bool>(v);
}

}  // namespace _facts_detail

// ============================================================================
// fact_registry
// ============================================================================

class fact_registry final : public memory_layer {
 public:
  // Throws configuration_error for a duplicate key or an unusable fact.
  void register_fact(fact f) {
    if (f.key.empty()) {
      throw primitives::configuration_error("facts need a key");
    }
    if (f.op == constraint_op::one_of && f.options.empty() && !f.validator) {
      throw primitives::configuration_error("fact '" + f.key + "' has an empty one_of list");
    }
    if (!f.validator && f.op != constraint_op::eq && f.op != constraint_op::ne
        && f.op != constraint_op::one_of && !_facts_detail::ordered(f.value)) {
      throw primitives::configuration_error("fact '" + f.key + "' orders a boolean");
    }

    std::scoped_lock lock(mutex_);
    if (facts_.contains(f.key)) {
      throw primitives::configuration_error("fact '" + f.key + "' is already registered");
    }
    auto key = f.key;
    facts_.emplace(std::move(key), std::move(f));
  }

  bool deprecate(const std::string& key, std::string reason) {
    std::scoped_lock lock(mutex_);
    auto             it = facts_.find(key);
    if (it == facts_.end()) {
      return false;
    }
    it->second.status             = fact_status::deprecated;
    it->second.deprecation_reason = std::move(reason);
    return true;
  }

  [[nodiscard]] std::optional<fact> find(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    auto             it = facts_.find(key);
    if (it == facts_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] std::vector<fact> active() const {
    std::scoped_lock  lock(mutex_);
    std::vector<fact> out;
    for (const auto& [key, f] : facts_) {
      if (f.status == fact_status::active) {
        out.push_back(f);
      }
    }
    return out;
  }

  [[nodiscard]] std::vector<fact> by_category(const std::string& category) const {
    std::scoped_lock  lock(mutex_);
    std::vector<fact> out;
    for (const auto& [key, f] : facts_) {
      if (f.category == category) {
        out.push_back(f);
      }
    }
    return out;
  }

  [[nodiscard]] fact_summary summary() const {
    std::scoped_lock lock(mutex_);
    fact_summary     s;
    s.total = facts_.size();
    for (const auto& [key, f] : facts_) {
      if (f.status == fact_status::active) {
        ++s.active;
      } else {
        ++s.deprecated;
      }
      ++s.by_category[f.category];
    }
    return s;
  }

  // memory_layer

  // Registers a string-valued equality fact; attributes "category" and
  // "rationale" fill the matching fields.
  void add(memory_record record) override {
    fact f;
    f.key   = record.key;
    f.value = std::move(record.content);
    if (auto it = record.attributes.find("category"); it != record.attributes.end()) {
      f.category = it->second;
    }
    if (auto it = record.attributes.find("rationale"); it != record.attributes.end()) {
      f.rationale = it->second;
    }
    register_fact(std::move(f));
  }

  [[nodiscard]] std::optional<memory_record> get(const std::string& key) const override {
    auto f = find(key);
    if (!f) {
      return std::nullopt;
    }
    return to_record(*f);
  }

  [[nodiscard]] std::vector<memory_record> search(const search_query& query) const override {
    std::vector<std::pair<double, memory_record>> scored;
    {
      std::scoped_lock lock(mutex_);
      for (const auto& [key, f] : facts_) {
        auto record = to_record(f);
        if (!query.filters.matches(record)) {
          continue;
        }
        const double score = keyword_relevance(query.text, record);
        if (score > 0.0) {
          scored.emplace_back(score, std::move(record));
        }
      }
    }
    return rank(std::move(scored), query.limit);
  }

  [[nodiscard]] validation_result validate(const std::string& key,
                                           const fact_value&  actual) const noexcept override {
    validation_result result;
    try {
      result.key    = key;
      result.actual = render(actual);

      auto f = find(key);
      if (!f) {
        result.message = fmt::format("no fact registered for '{}'", key);
        return result;
      }
      result.expected = f->expectation();

      if (f->status == fact_status::deprecated) {
        result.level   = severity::warning;
        result.message = fmt::format("fact '{}' is deprecated: {}", key, f->deprecation_reason);
        return result;
      }

      std::optional<std::string> violation = f->validator ? f->validator(actual) : check(*f, actual);
      result.is_valid = !violation.has_value();
      result.level    = result.is_valid ? severity::info : severity::error;
      result.message =
          result.is_valid ? fmt::format("{} {} holds", key, result.expected) : *violation;
    } catch (const std::exception& e) {
      result.is_valid = false;
      result.level    = severity::error;
      result.message  = fmt::format("validating '{}' raised: {}", key, e.what());
    }
    return result;
  }

 private:
  static std::optional<std::string> check(const fact& f, const fact_value& actual) {
    using _facts_detail::compare;

    if (f.op == constraint_op::one_of) {
      for (const auto& option : f.options) {
        if (compare(actual, option) == 0) {
          return std::nullopt;
        }
      }
      return fmt::format("{} is {}, expected {}", f.key, render(actual), f.expectation());
    }

    auto order = compare(actual, f.value);
    if (!order) {
      return fmt::format("{} is {}, which cannot be compared with {}", f.key, render(actual),
                         render(f.value));
    }

    bool ok = false;
    switch (f.op) {
      case constraint_op::eq:
        ok = *order == 0;
        break;
      case constraint_op::ne:
        ok = *order != 0;
        break;
      case constraint_op::ge:
        ok = *order >= 0;
        break;
      case constraint_op::gt:
        ok = *order > 0;
        break;
      case constraint_op::le:
        ok = *order <= 0;
        break;
      case constraint_op::lt:
        ok = *order < 0;
        break;
      case constraint_op::one_of:
        break;
    }
    if (ok) {
      return std::nullopt;
    }
    return fmt::format("{} is {}, expected {}", f.key, render(actual), f.expectation());
  }

  static memory_record to_record(const fact& f) {
    memory_record record;
    record.key                     = f.key;
    record.content                 = fmt::format("{} {}", f.key, f.expectation());
    record.importance              = 1.0;
    record.attributes["category"]  = f.category;
    record.attributes["rationale"] = f.rationale;
    record.attributes["status"] = f.status == fact_status::active ? "active" : "deprecated";
    if (!f.category.empty()) {
      record.tags.insert(f.category);
    }
    return record;
  }

  mutable std::mutex          mutex_;
  std::map<std::string, fact> facts_;
};

}  // namespace loom::memory
