#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

#include "cache.hpp"
#include "circuit_breaker.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "retry.hpp"

namespace loom::primitives {

// ============================================================================
// Environment
// ============================================================================

// Value of an environment variable, empty if unset.
inline std::string get_env(const std::string& key) {
  const char* value = std::getenv(key.c_str());
  return value != nullptr ? std::string(value) : std::string();
}

inline std::string get_env_or(const std::string& key, const std::string& fallback) {
  auto value = get_env(key);
  return value.empty() ? fallback : value;
}

// Exports KEY=VALUE lines from a .env file. Variables already set in the
// environment win. Returns false when the file does not exist.
inline bool load_dotenv(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return false;
  }

  constexpr std::string_view blanks = " \t\r\n";
  auto                       trim   = [&](std::string_view s) -> std::string_view {
    auto first = s.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
      return {};
    }
    auto last = s.find_last_not_of(blanks);
    return s.substr(first, last - first + 1);
  };

  std::ifstream file(path);
  std::string   line;
  while (std::getline(file, line)) {
    auto text = trim(line);
    if (text.empty() || text.front() == '#') {
      continue;
    }
    auto eq = text.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    std::string key(trim(text.substr(0, eq)));
    auto        value = trim(text.substr(eq + 1));
    if (value.size() >= 2
        && ((value.front() == '"' && value.back() == '"')
            || (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }
    if (!key.empty()) {
      ::setenv(key.c_str(), std::string(value).c_str(), 0);
    }
  }
  return true;
}

namespace _config_detail {

template <class T>
T parse_number(const std::string& key, const std::string& text) {
  T    value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw configuration_error(key + " is not a valid number: '" + text + "'");
  }
  return value;
}

template <class T>
T env_number(const std::string& key, T fallback) {
  auto text = get_env(key);
  return text.empty() ? fallback : parse_number<T>(key, text);
}

}  // namespace _config_detail

// ============================================================================
// runtime_config - process-level defaults for the decorators
// ============================================================================

struct runtime_config {
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::size_t               retry_max = 3;
  std::chrono::milliseconds retry_base_delay{100};
  std::chrono::seconds      cache_ttl{3600};
  std::size_t               cache_max_size    = 1000;
  std::size_t               breaker_threshold = 5;
  std::chrono::milliseconds breaker_cooldown{60'000};

  // Reads LOOM_LOG_LEVEL, LOOM_RETRY_MAX, LOOM_RETRY_BASE_MS,
  // LOOM_CACHE_TTL_SECONDS, LOOM_CACHE_MAX_SIZE, LOOM_BREAKER_THRESHOLD and
  // LOOM_BREAKER_COOLDOWN_MS. Unset variables keep their defaults; malformed
  // ones raise configuration_error.
  static runtime_config from_env() {
    using _config_detail::env_number;

    runtime_config cfg;
    if (auto level = get_env("LOOM_LOG_LEVEL"); !level.empty()) {
      cfg.log_level = spdlog::level::from_str(level);
      if (cfg.log_level == spdlog::level::off && level != "off") {
        throw configuration_error("LOOM_LOG_LEVEL is not a log level: '" + level + "'");
      }
    }
    cfg.retry_max = env_number<std::size_t>("LOOM_RETRY_MAX", cfg.retry_max);
    cfg.retry_base_delay = std::chrono::milliseconds(
        env_number<std::int64_t>("LOOM_RETRY_BASE_MS", cfg.retry_base_delay.count()));
    cfg.cache_ttl = std::chrono::seconds(
        env_number<std::int64_t>("LOOM_CACHE_TTL_SECONDS", cfg.cache_ttl.count()));
    cfg.cache_max_size = env_number<std::size_t>("LOOM_CACHE_MAX_SIZE", cfg.cache_max_size);
    cfg.breaker_threshold =
        env_number<std::size_t>("LOOM_BREAKER_THRESHOLD", cfg.breaker_threshold);
    cfg.breaker_cooldown = std::chrono::milliseconds(
        env_number<std::int64_t>("LOOM_BREAKER_COOLDOWN_MS", cfg.breaker_cooldown.count()));
    return cfg;
  }

  void apply_logging() const {
    set_log_level(log_level);
  }

  [[nodiscard]] retry_policy retry_defaults() const {
    retry_policy policy;
    policy.max_retries = retry_max;
    policy.base_delay  = retry_base_delay;
    policy.max_delay   = std::max(policy.max_delay, retry_base_delay);
    return policy;
  }

  [[nodiscard]] cache_options cache_defaults() const {
    cache_options opts;
    opts.ttl      = std::chrono::duration_cast<std::chrono::milliseconds>(cache_ttl);
    opts.max_size = cache_max_size;
    return opts;
  }

  [[nodiscard]] circuit_breaker_options breaker_defaults() const {
    circuit_breaker_options opts;
    opts.failure_threshold = breaker_threshold;
    opts.cooldown          = breaker_cooldown;
    return opts;
  }
};

}  // namespace loom::primitives
