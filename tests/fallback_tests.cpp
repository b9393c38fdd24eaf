// fallback_tests.cpp
// Ordered alternatives and error propagation

#include <boost/ut.hpp>
#include <chrono>
#include <loom/primitives.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int main() {
  using namespace boost::ut;
  using namespace loom::primitives;

  "primary_success_skips_alternatives"_test = [] {
    std::vector<std::string> order;
    auto primary = lambda<int>([&order](int x) { order.push_back("A"); return x; }, "A");
    auto backup  = lambda<int>([&order](int x) { order.push_back("B"); return -x; }, "B");

    auto    op = fallback_of(primary, backup);
    context ctx;
    expect(eq(op->execute(4, ctx), 4));
    expect(order == std::vector<std::string>{"A"});
  };

  "alternatives_run_in_order"_test = [] {
    std::vector<std::string> order;
    auto a = lambda<int>([&order](int) -> int { order.push_back("A"); throw std::runtime_error("A"); },
                         "A");
    auto b = lambda<int>([&order](int) -> int { order.push_back("B"); throw std::runtime_error("B"); },
                         "B");
    auto c = lambda<int>([&order](int x) { order.push_back("C"); return x + 1; }, "C");

    auto    op = fallback_of(a, b, c);
    context ctx;
    expect(eq(op->execute(1, ctx), 2));
    expect(order == std::vector<std::string>{"A", "B", "C"});
  };

  "last_error_propagates"_test = [] {
    auto a = lambda<int>([](int) -> int { throw std::runtime_error("first"); }, "A");
    auto b = lambda<int>([](int) -> int { throw std::logic_error("last"); }, "B");

    auto    op = fallback_of(a, b);
    context ctx;
    try {
      op->execute(1, ctx);
      expect(false) << "expected an exception";
    } catch (const std::logic_error& e) {
      expect(eq(std::string(e.what()), std::string("last")));
    }
  };

  "each_alternative_gets_the_original_input"_test = [] {
    auto mutating = lambda<std::string>(
        [](std::string s) -> std::string {
          s += "-changed";
          throw std::runtime_error(s);
        },
        "mutating");
    auto echo = lambda<std::string>([](std::string s) { return s; }, "echo");

    auto    op = fallback_of(mutating, echo);
    context ctx;
    expect(eq(op->execute("input", ctx), std::string("input")));
  };

  "activation_is_reported"_test = [] {
    auto sink = std::make_shared<metrics_sink>();
    auto a    = lambda<int>([](int) -> int { throw std::runtime_error("down"); }, "A");
    auto b    = lambda<int>([](int x) { return x; }, "B");

    fallback_primitive<int, int> op(a, {b}, fallback_options{.name = "guarded", .sink = sink});
    context                      ctx;
    expect(eq(op.execute(9, ctx), 9));
    expect(eq(sink->counter_value("events", {{"event", "fallback_activated"}, {"primitive", "guarded"}}),
              1.0));
  };

  "missing_alternatives_are_rejected"_test = [] {
    auto a = lambda<int>([](int x) { return x; }, "A");
    expect(throws<configuration_error>(
        [&] { fallback_primitive<int, int>(a, std::vector<primitive_ptr<int, int>>{}); }));
    expect(throws<configuration_error>(
        [&] { fallback_primitive<int, int>(a, std::vector<primitive_ptr<int, int>>{nullptr}); }));
  };

  "non_standard_exceptions_trigger_alternatives"_test = [] {
    auto primary = lambda<int>([](int) -> int { throw 42; }, "primary");
    auto backup  = lambda<int>([](int x) { return x * 10; }, "backup");

    auto    op = fallback_of(primary, backup);
    context ctx;
    expect(eq(op->execute(3, ctx), 30));
  };

  "expired_timeout_routes_to_alternative"_test = [] {
    auto slow = lambda<std::string>(
        [](std::string q, context& ctx) {
          for (int i = 0; i < 100 && !ctx.stop_requested(); ++i) {
            std::this_thread::sleep_for(10ms);
          }
          return "live " + q;
        },
        "remote");
    auto canned = lambda<std::string>([](std::string q) { return "canned " + q; }, "canned");
    auto metrics = std::make_shared<metrics_sink>();

    auto safe = fallback_primitive<std::string, std::string>(
        timeout(slow, timeout_options{.name = "remote.timeout", .limit = 50ms}), {canned},
        fallback_options{.name = "safe_call", .sink = metrics});

    context    ctx;
    const auto start = std::chrono::steady_clock::now();
    expect(eq(safe.execute("quote", ctx), std::string("canned quote")));
    expect(std::chrono::steady_clock::now() - start < 900ms);
    expect(eq(metrics->counter_value("events", {{"event", "fallback_activated"}, {"primitive", "safe_call"}}),
              1.0));
  };

  return 0;
}
