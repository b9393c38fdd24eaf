#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace loom::memory {

// ============================================================================
// Records shared by every layer
// ============================================================================

struct memory_record {
  std::string                           key;
  std::string                           content;
  std::set<std::string>                 tags;
  // 0 (disposable) .. 1 (essential).
  double                                importance = 0.5;
  std::chrono::system_clock::time_point created_at{};
  std::map<std::string, std::string>    attributes;
};

struct search_filters {
  // A record must carry every one of these tags.
  std::set<std::string>                                tags;
  double                                               min_importance = 0.0;
  std::optional<std::chrono::system_clock::time_point> since;

  [[nodiscard]] bool matches(const memory_record& record) const {
    if (record.importance < min_importance) {
      return false;
    }
    if (since && record.created_at < *since) {
      return false;
    }
    for (const auto& tag : tags) {
      if (!record.tags.contains(tag)) {
        return false;
      }
    }
    return true;
  }
};

struct search_query {
  std::string    text;
  std::size_t    limit = 10;
  search_filters filters;
};

// ============================================================================
// Validation results
// ============================================================================

using fact_value = std::variant<bool, std::int64_t, double, std::string>;

inline std::string render(const fact_value& value) {
  return std::visit(
      []<class T>(const T& v) -> std::string {
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return fmt::format("{}", v);
        }
      },
      value);
}

enum class severity { info, warning, error };

inline constexpr std::string_view to_string(severity level) noexcept {
  switch (level) {
    case severity::info:
      return "info";
    case severity::warning:
      return "warning";
    case severity::error:
      return "error";
  }
  return "unknown";
}

struct validation_result {
  bool        is_valid = false;
  std::string key;
  std::string expected;
  std::string actual;
  std::string message;
  severity    level = severity::error;
};

// Result of a layer that validates by presence: valid when key is stored.
inline validation_result presence_result(std::string_view layer, const std::string& key,
                                         bool found, const fact_value& actual) {
  validation_result result;
  result.is_valid = found;
  result.key      = key;
  result.expected = "present";
  result.actual   = render(actual);
  result.level    = found ? severity::info : severity::error;
  result.message  = found ? fmt::format("{} holds '{}'", layer, key)
                          : fmt::format("{} has no entry '{}'", layer, key);
  return result;
}

// ============================================================================
// memory_layer - the capability every layer exposes
// ============================================================================

class memory_layer {
 public:
  virtual ~memory_layer() = default;

  virtual void add(memory_record record) = 0;

  [[nodiscard]] virtual std::optional<memory_record> get(const std::string& key) const = 0;

  [[nodiscard]] virtual std::vector<memory_record> search(const search_query& query) const = 0;

  // Checks `actual` against what the layer holds under key. Never throws.
  [[nodiscard]] virtual validation_result validate(const std::string& key,
                                                   const fact_value&  actual) const noexcept = 0;
};

}  // namespace loom::memory
