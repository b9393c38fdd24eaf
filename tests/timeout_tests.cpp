// timeout_tests.cpp
// Deadlines, fallbacks and stop signalling for slow primitives

#include <atomic>
#include <boost/ut.hpp>
#include <chrono>
#include <loom/primitives.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto sleeper(std::chrono::milliseconds d) {
  return loom::primitives::lambda<int>(
      [d](int x) {
        std::this_thread::sleep_for(d);
        return x;
      },
      "sleeper");
}

}  // namespace

int main() {
  using namespace boost::ut;
  using namespace loom::primitives;

  "fast_operation_returns_its_result"_test = [] {
    auto    op = timeout(sleeper(10ms), timeout_options{.limit = 500ms});
    context ctx;
    expect(eq(op->execute(7, ctx), 7));
  };

  "slow_operation_raises_timeout_error"_test = [] {
    auto       op    = timeout(sleeper(500ms), timeout_options{.limit = 50ms});
    context    ctx;
    const auto start = std::chrono::steady_clock::now();
    expect(throws<timeout_error>([&] { op->execute(1, ctx); }));
    const auto waited = std::chrono::steady_clock::now() - start;
    expect(waited >= 50ms);
    expect(waited < 400ms);
  };

  "errors_before_the_deadline_propagate"_test = [] {
    auto op = timeout(lambda<int>([](int) -> int { throw std::invalid_argument("nope"); }, "bad"),
                      timeout_options{.limit = 500ms});
    context ctx;
    expect(throws<std::invalid_argument>([&] { op->execute(1, ctx); }));
  };

  "fallback_value_on_expiry"_test = [] {
    auto    op = timeout_or(sleeper(500ms), timeout_options{.limit = 30ms}, -1);
    context ctx;
    expect(eq(op->execute(1, ctx), -1));
  };

  "fallback_primitive_receives_the_input"_test = [] {
    auto backup = lambda<int>([](int x) { return x * 100; }, "backup");
    auto op     = timeout(sleeper(500ms), timeout_options{.limit = 30ms}, backup);

    context ctx;
    expect(eq(op->execute(3, ctx), 300));
  };

  "expiry_signals_the_operation"_test = [] {
    auto observed = std::make_shared<std::atomic<bool>>(false);
    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto patient  = lambda<int>(
        [observed, finished](int x, context& ctx) {
          for (int i = 0; i < 200 && !ctx.stop_requested(); ++i) {
            std::this_thread::sleep_for(5ms);
          }
          observed->store(ctx.stop_requested());
          finished->store(true);
          return x;
        },
        "patient");

    auto    op = timeout(patient, timeout_options{.limit = 20ms});
    context ctx;
    expect(throws<timeout_error>([&] { op->execute(1, ctx); }));

    for (int i = 0; i < 200 && !finished->load(); ++i) {
      std::this_thread::sleep_for(5ms);
    }
    expect(finished->load());
    expect(observed->load());
    expect(!ctx.stop_requested());
  };

  "operation_shares_the_caller_state"_test = [] {
    auto writer = lambda<int>(
        [](int x, context& ctx) {
          ctx.state().set("written", true);
          return x;
        },
        "writer");
    auto    op = timeout(writer, timeout_options{.limit = 500ms});
    context ctx;
    expect(eq(op->execute(1, ctx), 1));
    expect(ctx.state().get_or("written", false));
  };

  "non_positive_limit_is_rejected"_test = [] {
    expect(throws<configuration_error>(
        [] { timeout(sleeper(1ms), timeout_options{.limit = 0ms}); }));
  };

  return 0;
}
