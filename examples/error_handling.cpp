#include <atomic>
#include <chrono>
#include <iostream>
#include <loom/primitives.hpp>
#include <memory>
#include <string>
#include <thread>

using namespace loom::primitives;
using namespace std::chrono_literals;

auto main() -> int {
  init_logger(spdlog::level::debug);
  auto metrics = std::make_shared<metrics_sink>();

  // Fails twice, then answers.
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto flaky = lambda<std::string>(
      [calls](const std::string& q) -> std::string {
        if (++*calls < 3) {
          throw operation_error("upstream busy");
        }
        return "answer to " + q;
      },
      "flaky", metrics);

  retry_policy policy;
  policy.max_retries = 3;
  policy.base_delay  = 10ms;
  policy.sink        = metrics;

  auto cheap = lambda<std::string>([](const std::string& q) { return "cached answer to " + q; },
                                   "cheap", metrics);

  auto guarded = with_circuit_breaker(
      fallback_of(retry(flaky, policy), cheap),
      circuit_breaker_options{.name = "upstream", .failure_threshold = 2, .cooldown = 5s, .sink = metrics});

  context ctx;
  std::cout << guarded->execute("life", ctx) << '\n';
  std::cout << "attempts: " << calls->load() << '\n';

  auto slow = lambda<int>(
      [](int x) {
        std::this_thread::sleep_for(200ms);
        return x;
      },
      "slow");
  auto bounded = timeout_or(slow, timeout_options{.name = "bounded", .limit = 50ms}, -1);
  std::cout << "bounded: " << bounded->execute(7, ctx) << '\n';

  auto snap = metrics->snapshot();
  for (const auto& [series, value] : snap.counters) {
    std::cout << series << " = " << value << '\n';
  }
  return 0;
}
