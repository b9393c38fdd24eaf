#pragma once

#include <memory>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace loom::primitives {

// Logger shared by all loom components. Applications that register their own
// spdlog logger named "loom" before first use get theirs picked up instead.
inline std::shared_ptr<spdlog::logger> logger() {
  static std::mutex                      mutex;
  static std::shared_ptr<spdlog::logger> instance;

  std::scoped_lock lock(mutex);
  if (!instance) {
    instance = spdlog::get("loom");
    if (!instance) {
      instance = spdlog::stdout_color_mt("loom");
    }
  }
  return instance;
}

// Initialize logging with console output
inline void init_logger(spdlog::level::level_enum level = spdlog::level::info) {
  auto log = logger();
  log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  log->set_level(level);
}

inline void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

}  // namespace loom::primitives
