// parallel_tests.cpp
// Concurrent branches: ordering, fail-fast, settled outcomes, cancellation

#include <atomic>
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

  "results_follow_branch_order"_test = [] {
    // Later branches finish first.
    auto slow = lambda<int>([](int x) { std::this_thread::sleep_for(60ms); return x + 1; }, "slow");
    auto mid  = lambda<int>([](int x) { std::this_thread::sleep_for(30ms); return x + 2; }, "mid");
    auto fast = lambda<int>([](int x) { return x + 3; }, "fast");

    auto    group = parallel_of(slow, mid, fast);
    context ctx;
    expect(group->execute(10, ctx) == std::vector<int>{11, 12, 13});
  };

  "branches_run_concurrently"_test = [] {
    std::vector<primitive_ptr<int, int>> branches;
    for (int i = 0; i < 4; ++i) {
      branches.push_back(
          lambda<int>([](int x) { std::this_thread::sleep_for(100ms); return x; }, "sleeper"));
    }
    parallel<int, int> group(branches);

    context    ctx;
    const auto start   = std::chrono::steady_clock::now();
    auto       results = group.execute(1, ctx);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    expect(eq(results.size(), std::size_t{4}));
    expect(elapsed < 350ms);
  };

  "settled_mode_keeps_every_outcome"_test = [] {
    auto ok     = lambda<int>([](int x) { return x * 2; }, "ok");
    auto broken = lambda<int>([](int) -> int { throw std::runtime_error("broken"); }, "broken");
    auto late   = lambda<int>([](int x) { std::this_thread::sleep_for(20ms); return x * 3; }, "late");

    auto    group    = parallel_of<parallel_mode::settled>(ok, broken, late);
    context ctx;
    auto    outcomes = group->execute(5, ctx);

    expect(eq(outcomes.size(), std::size_t{3}));
    expect(outcomes[0].has_value() && *outcomes[0] == 10);
    expect(!outcomes[1].has_value());
    expect(eq(describe(outcomes[1].error()), std::string("broken")));
    expect(outcomes[2].has_value() && *outcomes[2] == 15);
  };

  "fail_fast_rethrows_first_error"_test = [] {
    auto ok     = lambda<int>([](int x) { std::this_thread::sleep_for(200ms); return x; }, "ok");
    auto broken = lambda<int>([](int) -> int { throw operation_error("fast failure"); }, "broken");

    auto       group = parallel_of(ok, broken);
    context    ctx;
    const auto start = std::chrono::steady_clock::now();
    expect(throws<operation_error>([&] { group->execute(1, ctx); }));
    expect(std::chrono::steady_clock::now() - start < 180ms);
  };

  "fail_fast_signals_remaining_branches"_test = [] {
    auto stopped = std::make_shared<std::atomic<bool>>(false);
    auto waiter  = lambda<int>(
        [stopped](int x, context& ctx) {
          for (int i = 0; i < 100 && !ctx.stop_requested(); ++i) {
            std::this_thread::sleep_for(5ms);
          }
          stopped->store(ctx.stop_requested());
          return x;
        },
        "waiter");
    auto broken = lambda<int>([](int) -> int { throw std::runtime_error("boom"); }, "broken");

    context ctx;
    {
      auto group = parallel_of(waiter, broken);
      expect(throws<std::runtime_error>([&] { group->execute(1, ctx); }));
      // Destroying the group drains its pool.
    }
    expect(stopped->load());
  };

  "branches_get_child_contexts"_test = [] {
    auto writer = lambda<int>(
        [](int x, context& ctx) {
          ctx.state().set("branch", x);
          return static_cast<int>(ctx.parent_span_id().size());
        },
        "writer");

    auto    group = parallel_of(writer, writer);
    context ctx;
    auto    spans = group->execute(1, ctx);
    expect(eq(spans[0], 16));
    expect(!ctx.state().contains("branch"));
  };

  "pipe_operator_extends_the_group"_test = [] {
    auto a = lambda<int>([](int x) { return x; }, "a");
    auto b = lambda<int>([](int x) { return x * 10; }, "b");
    auto c = lambda<int>([](int x) { return x * 100; }, "c");

    auto group = a | b | c;
    auto impl  = std::dynamic_pointer_cast<parallel<int, int>>(group);
    expect(impl != nullptr);
    expect(eq(impl->branches().size(), std::size_t{3}));

    context ctx;
    expect(group->execute(2, ctx) == std::vector<int>{2, 20, 200});
  };

  "shared_pool_is_reused"_test = [] {
    auto pool = std::make_shared<thread_pool>(2);
    auto id   = lambda<int>([](int x) { return x; }, "id");

    parallel<int, int> first({id, id}, parallel_options{.name = "first", .pool = pool});
    parallel<int, int> second({id, id, id}, parallel_options{.name = "second", .pool = pool});

    context ctx;
    expect(first.execute(1, ctx) == std::vector<int>{1, 1});
    expect(second.execute(2, ctx) == std::vector<int>{2, 2, 2});
    expect(eq(pool->size(), std::size_t{2}));
  };

  "nested_groups_on_one_pool_complete"_test = [] {
    for (std::size_t workers : {std::size_t{1}, std::size_t{2}}) {
      auto pool  = std::make_shared<thread_pool>(workers);
      auto id    = lambda<int>([](int x) { return x; }, "id");
      auto inner = std::make_shared<parallel<int, int>>(
          std::vector<primitive_ptr<int, int>>{id, id}, parallel_options{.name = "inner", .pool = pool});
      auto branch = lambda<int>(
          [inner](int x, context& ctx) {
            auto values = inner->execute(x, ctx);
            return values[0] + values[1];
          },
          "branch");

      parallel<int, int> outer({branch, branch}, parallel_options{.name = "outer", .pool = pool});

      context ctx;
      expect(outer.execute(3, ctx) == std::vector<int>{6, 6});
    }
  };

  "empty_group_is_rejected"_test = [] {
    expect(throws<configuration_error>(
        [] { parallel<int, int>(std::vector<primitive_ptr<int, int>>{}); }));
  };

  return 0;
}
