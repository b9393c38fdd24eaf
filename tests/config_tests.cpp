// config_tests.cpp
// Environment lookups, .env loading and runtime defaults

#include <boost/ut.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <loom/primitives.hpp>
#include <string>

using namespace std::chrono_literals;

namespace {

const char* const loom_variables[] = {
    "LOOM_LOG_LEVEL",      "LOOM_RETRY_MAX",         "LOOM_RETRY_BASE_MS",       "LOOM_CACHE_TTL_SECONDS",
    "LOOM_CACHE_MAX_SIZE", "LOOM_BREAKER_THRESHOLD", "LOOM_BREAKER_COOLDOWN_MS",
};

void clear_loom_env() {
  for (const char* name : loom_variables) {
    ::unsetenv(name);
  }
}

}  // namespace

int main() {
  using namespace boost::ut;
  using namespace loom::primitives;

  "get_env_and_fallback"_test = [] {
    ::setenv("LOOM_TEST_PRESENT", "value", 1);
    ::unsetenv("LOOM_TEST_ABSENT");

    expect(eq(get_env("LOOM_TEST_PRESENT"), std::string("value")));
    expect(get_env("LOOM_TEST_ABSENT").empty());
    expect(eq(get_env_or("LOOM_TEST_ABSENT", "fallback"), std::string("fallback")));
    expect(eq(get_env_or("LOOM_TEST_PRESENT", "fallback"), std::string("value")));
  };

  "dotenv_exports_without_overwriting"_test = [] {
    auto path = std::filesystem::temp_directory_path() / "loom_config_tests.env";
    {
      std::ofstream out(path);
      out << "# comment\n"
          << "LOOM_DOTENV_PLAIN = plain\n"
          << "LOOM_DOTENV_QUOTED=\"with spaces\"\n"
          << "LOOM_DOTENV_KEPT=from-file\n"
          << "not a pair\n";
    }
    ::unsetenv("LOOM_DOTENV_PLAIN");
    ::unsetenv("LOOM_DOTENV_QUOTED");
    ::setenv("LOOM_DOTENV_KEPT", "from-env", 1);

    expect(load_dotenv(path));
    expect(eq(get_env("LOOM_DOTENV_PLAIN"), std::string("plain")));
    expect(eq(get_env("LOOM_DOTENV_QUOTED"), std::string("with spaces")));
    expect(eq(get_env("LOOM_DOTENV_KEPT"), std::string("from-env")));

    std::filesystem::remove(path);
    expect(!load_dotenv(path));
  };

  "defaults_when_unset"_test = [] {
    clear_loom_env();
    auto cfg = runtime_config::from_env();
    expect(cfg.log_level == spdlog::level::info);
    expect(eq(cfg.retry_max, std::size_t{3}));
    expect(cfg.retry_base_delay == 100ms);
    expect(cfg.cache_ttl == 3600s);
    expect(eq(cfg.cache_max_size, std::size_t{1000}));
    expect(eq(cfg.breaker_threshold, std::size_t{5}));
    expect(cfg.breaker_cooldown == 60s);
  };

  "overrides_from_environment"_test = [] {
    clear_loom_env();
    ::setenv("LOOM_LOG_LEVEL", "debug", 1);
    ::setenv("LOOM_RETRY_MAX", "5", 1);
    ::setenv("LOOM_RETRY_BASE_MS", "250", 1);
    ::setenv("LOOM_CACHE_TTL_SECONDS", "60", 1);
    ::setenv("LOOM_CACHE_MAX_SIZE", "16", 1);
    ::setenv("LOOM_BREAKER_THRESHOLD", "2", 1);
    ::setenv("LOOM_BREAKER_COOLDOWN_MS", "1500", 1);

    auto cfg = runtime_config::from_env();
    expect(cfg.log_level == spdlog::level::debug);
    expect(eq(cfg.retry_max, std::size_t{5}));

    auto retry = cfg.retry_defaults();
    expect(eq(retry.max_retries, std::size_t{5}));
    expect(retry.base_delay == 250ms);
    expect(retry.max_delay >= retry.base_delay);

    auto cache = cfg.cache_defaults();
    expect(cache.ttl == 60s);
    expect(eq(cache.max_size, std::size_t{16}));

    auto breaker = cfg.breaker_defaults();
    expect(eq(breaker.failure_threshold, std::size_t{2}));
    expect(breaker.cooldown == 1500ms);

    cfg.apply_logging();
    expect(logger()->level() == spdlog::level::debug);
    set_log_level(spdlog::level::info);
    clear_loom_env();
  };

  "malformed_values_are_rejected"_test = [] {
    clear_loom_env();
    ::setenv("LOOM_RETRY_MAX", "three", 1);
    expect(throws<configuration_error>([] { runtime_config::from_env(); }));

    clear_loom_env();
    ::setenv("LOOM_CACHE_MAX_SIZE", "12abc", 1);
    expect(throws<configuration_error>([] { runtime_config::from_env(); }));

    clear_loom_env();
    ::setenv("LOOM_LOG_LEVEL", "chatty", 1);
    expect(throws<configuration_error>([] { runtime_config::from_env(); }));

    clear_loom_env();
    ::setenv("LOOM_LOG_LEVEL", "off", 1);
    expect(runtime_config::from_env().log_level == spdlog::level::off);
    clear_loom_env();
  };

  "configured_defaults_drive_decorators"_test = [] {
    clear_loom_env();
    ::setenv("LOOM_CACHE_MAX_SIZE", "1", 1);
    auto cfg = runtime_config::from_env();
    clear_loom_env();

    auto square = lambda<int>([](int x) { return x * x; }, "square");
    auto memo   = cached(square, cfg.cache_defaults());

    context ctx;
    memo->execute(2, ctx);
    memo->execute(3, ctx);
    expect(eq(memo->stats().size, std::size_t{1}));
  };

  return 0;
}
