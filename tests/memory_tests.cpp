// memory_tests.cpp
// Session, window and deep layers, backing stores and the memory primitive

#include <algorithm>
#include <boost/ut.hpp>
#include <chrono>
#include <loom/memory.hpp>
#include <loom/primitives.hpp>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

using namespace loom::memory;

memory_record note(std::string key, std::string content, std::set<std::string> tags = {},
                   double importance = 0.5) {
  memory_record record;
  record.key        = std::move(key);
  record.content    = std::move(content);
  record.tags       = std::move(tags);
  record.importance = importance;
  return record;
}

// Remote store that is down.
class offline_store final : public memory_store {
 public:
  void add(const std::string& /*unused*/, memory_record /*unused*/,
           std::optional<std::chrono::milliseconds> /*unused*/) override {
    throw store_unavailable_error("vector db offline");
  }
  std::optional<memory_record> get(const std::string& /*unused*/) override {
    throw store_unavailable_error("vector db offline");
  }
  std::vector<memory_record> search(const std::string& /*unused*/, std::size_t /*unused*/,
                                    const search_filters& /*unused*/) override {
    throw store_unavailable_error("vector db offline");
  }
  bool erase(const std::string& /*unused*/) override {
    throw store_unavailable_error("vector db offline");
  }
};

std::vector<std::string> keys(const std::vector<memory_record>& records) {
  std::vector<std::string> out;
  for (const auto& r : records) {
    out.push_back(r.key);
  }
  return out;
}

}  // namespace

int main() {
  using namespace boost::ut;
  using namespace loom::memory;
  using loom::primitives::manual_clock;

  // ==========================================================================
  // session
  // ==========================================================================

  "session_history_in_order"_test = [] {
    session_memory session;
    session.append("s1", message{.role = "user", .content = "hello"});
    session.append("s1", message{.role = "assistant", .content = "hi there"});
    session.append("s2", message{.role = "user", .content = "other"});

    auto history = session.history("s1");
    expect(eq(history.size(), std::size_t{2}));
    expect(eq(history[0].content, std::string("hello")));
    expect(eq(history[1].role, std::string("assistant")));
    expect(eq(session.size("s2"), std::size_t{1}));
    expect(eq(session.sessions().size(), std::size_t{2}));
  };

  "session_history_limit_keeps_the_latest"_test = [] {
    session_memory session;
    for (int i = 0; i < 5; ++i) {
      session.append("s", message{.role = "user", .content = std::to_string(i)});
    }
    auto last = session.history("s", 2);
    expect(eq(last.size(), std::size_t{2}));
    expect(eq(last[0].content, std::string("3")));
    expect(eq(last[1].content, std::string("4")));
  };

  "session_max_messages_drops_oldest"_test = [] {
    session_memory session(nullptr, 3);
    for (int i = 0; i < 5; ++i) {
      session.append("s", message{.role = "user", .content = std::to_string(i)});
    }
    auto history = session.history("s");
    expect(eq(history.size(), std::size_t{3}));
    expect(eq(history.front().content, std::string("2")));
  };

  "session_window_uses_timestamps"_test = [] {
    auto           time = std::make_shared<manual_clock>();
    session_memory session(time);
    session.append("s", message{.role = "user", .content = "old"});
    time->advance(2h);
    session.append("s", message{.role = "user", .content = "new"});

    auto recent = session.window("s", 1h);
    expect(eq(recent.size(), std::size_t{1}));
    expect(eq(recent[0].content, std::string("new")));
    expect(session.clear("s"));
    expect(eq(session.size("s"), std::size_t{0}));
  };

  "session_as_memory_layer"_test = [] {
    session_memory session;
    auto           record = note("s1", "deploy the payment service");
    record.attributes["role"] = "assistant";
    session.add(record);
    session.add(note("s2", "unrelated chat"));

    auto latest = session.get("s1");
    expect(latest.has_value());
    expect(eq(latest->attributes.at("role"), std::string("assistant")));

    search_query query{.text = "payment"};
    expect(keys(session.search(query)) == std::vector<std::string>{"s1"});

    query.text         = "";
    query.filters.tags = {"session:s2"};
    expect(keys(session.search(query)) == std::vector<std::string>{"s2"});

    expect(session.validate("s1", std::string("any")).is_valid);
    expect(!session.validate("missing", std::string("any")).is_valid);
  };

  // ==========================================================================
  // deep
  // ==========================================================================

  "deep_search_ranks_by_relevance"_test = [] {
    deep_memory deep;
    deep.add(note("a", "postgres connection pooling guide", {"db"}));
    deep.add(note("b", "postgres backup schedule", {"db", "ops"}));
    deep.add(note("c", "frontend build pipeline", {"web"}));

    auto results = deep.search(search_query{.text = "postgres pooling"});
    expect(eq(results.size(), std::size_t{2}));
    expect(eq(results[0].key, std::string("a")));
    expect(eq(results[1].key, std::string("b")));
  };

  "deep_filters_by_tags_and_importance"_test = [] {
    deep_memory deep;
    deep.add(note("a", "postgres guide", {"db"}, 0.9));
    deep.add(note("b", "postgres backups", {"db", "ops"}, 0.4));
    deep.add(note("c", "postgres notes", {"ops"}, 0.95));

    search_query by_tag{.text = "postgres", .filters = {.tags = {"db"}}};
    expect(keys(deep.search(by_tag)) == std::vector<std::string>{"a", "b"});

    search_query by_importance{.text = "postgres", .filters = {.min_importance = 0.5}};
    expect(keys(deep.search(by_importance)) == std::vector<std::string>{"c", "a"});
  };

  "deep_limit_and_tie_breaks"_test = [] {
    deep_memory deep;
    deep.add(note("low", "cache policy", {}, 0.2));
    deep.add(note("high", "cache policy", {}, 0.8));
    deep.add(note("mid", "cache policy", {}, 0.5));

    auto top = deep.search(search_query{.text = "cache", .limit = 2});
    expect(keys(top) == std::vector<std::string>{"high", "mid"});
  };

  "deep_rejects_bad_records"_test = [] {
    deep_memory deep;
    expect(throws<loom::primitives::validation_error>([&] { deep.add(note("", "no key")); }));
    expect(throws<loom::primitives::validation_error>(
        [&] { deep.add(note("k", "too important", {}, 1.5)); }));
  };

  "deep_custom_relevance"_test = [] {
    deep_options opts;
    opts.store_prefilter = false;
    opts.relevance       = [](std::string_view, const memory_record& r) -> double {
      return r.content.size() > 10 ? 1.0 : 0.0;
    };
    deep_memory deep(nullptr, opts);
    deep.add(note("short", "tiny"));
    deep.add(note("long", "a much longer entry"));

    expect(keys(deep.search(search_query{.text = "zzz"})) == std::vector<std::string>{"long"});
  };

  "deep_ttl_expires_records"_test = [] {
    auto         time = std::make_shared<manual_clock>();
    deep_options opts;
    opts.ttl = 1000ms;
    deep_memory deep(std::make_shared<in_memory_store>(100, time), opts, time);
    deep.add(note("k", "short lived"));
    expect(deep.get("k").has_value());
    time->advance(1000ms);
    expect(!deep.get("k").has_value());
    expect(!deep.validate("k", true).is_valid);
  };

  // ==========================================================================
  // window
  // ==========================================================================

  "window_merges_recent_session_and_deep"_test = [] {
    auto time    = std::make_shared<manual_clock>();
    auto session = std::make_shared<session_memory>(time);
    auto deep    = std::make_shared<deep_memory>(nullptr, deep_options{}, time);
    window_memory window(session, deep, 1h, time);

    deep->add(note("old-fact", "kafka retention is seven days"));
    time->advance(2h);
    deep->add(note("new-fact", "kafka partitions doubled"));
    session->append("s1", message{.role = "user", .content = "why is kafka lagging"});

    auto results = window.search(search_query{.text = "kafka"});
    auto found   = keys(results);
    expect(eq(found.size(), std::size_t{2}));
    expect(std::ranges::find(found, "old-fact") == found.end());
    expect(std::ranges::find(found, "new-fact") != found.end());
    expect(std::ranges::find(found, "s1") != found.end());

    expect(window.get("new-fact").has_value());
    expect(!window.get("old-fact").has_value());
    expect(eq(window.recent(search_query{.text = "kafka"}, 3h).size(), std::size_t{3}));
  };

  "window_writes_go_to_deep"_test = [] {
    auto session = std::make_shared<session_memory>();
    auto deep    = std::make_shared<deep_memory>();
    window_memory window(session, deep, 1h);
    window.add(note("k", "written through the window"));
    expect(deep->get("k").has_value());
  };

  // ==========================================================================
  // stores
  // ==========================================================================

  "in_memory_store_evicts_least_recent"_test = [] {
    in_memory_store store(2);
    store.add("a", note("a", "one"), std::nullopt);
    store.add("b", note("b", "two"), std::nullopt);
    expect(store.get("a").has_value());
    store.add("c", note("c", "three"), std::nullopt);
    expect(!store.get("b").has_value());
    expect(eq(store.size(), std::size_t{2}));
    expect(store.erase("a"));
  };

  "fallback_store_degrades_once"_test = [] {
    auto local = std::make_shared<in_memory_store>();
    fallback_store store(std::make_shared<offline_store>(), local);

    store.add("k", note("k", "kept locally"), std::nullopt);
    expect(store.degraded());
    expect(store.get("k").has_value());
    expect(eq(store.search("locally", 5, {}).size(), std::size_t{1}));
    expect(store.erase("k"));
  };

  "deep_memory_over_unreachable_remote"_test = [] {
    auto store = std::make_shared<fallback_store>(std::make_shared<offline_store>(),
                                                  std::make_shared<in_memory_store>());
    deep_memory deep(store);
    deep.add(note("k", "survives the outage"));
    expect(eq(deep.search(search_query{.text = "outage"}).size(), std::size_t{1}));
  };

  // ==========================================================================
  // memory primitive
  // ==========================================================================

  "memory_primitive_routes_to_layers"_test = [] {
    auto memory = make_memory(memory_layers::in_process());
    loom::primitives::context ctx{loom::primitives::context::options{.session_id = "chat-7"}};

    memory_request add{.op = memory_operation::add, .layer = memory_layer_kind::session};
    add.record.content = "remember the launch date";
    expect(memory->execute(add, ctx).found);
    expect(eq(memory->layers().session->size("chat-7"), std::size_t{1}));

    memory_request deep_add{.op = memory_operation::add, .layer = memory_layer_kind::deep};
    deep_add.record = note("launch", "launch is on friday", {"release"});
    memory->execute(deep_add, ctx);

    memory_request search{.op = memory_operation::search, .layer = memory_layer_kind::deep};
    search.query.text = "launch";
    auto found        = memory->execute(search, ctx);
    expect(found.found);
    expect(eq(found.records.front().key, std::string("launch")));

    memory_request get{.op = memory_operation::get, .layer = memory_layer_kind::session};
    auto latest = memory->execute(get, ctx);
    expect(latest.found);
    expect(eq(latest.records.front().content, std::string("remember the launch date")));

    expect(eq(ctx.checkpoints().back().name, std::string("memory.session.get")));
  };

  "memory_primitive_validates_facts"_test = [] {
    auto layers = memory_layers::in_process();
    layers.facts->register_fact(
        fact{.key = "test-coverage", .value = 80.0, .category = "quality", .op = constraint_op::ge});
    memory_primitive memory(layers);

    loom::primitives::context ctx;
    memory_request            check{.op     = memory_operation::validate,
                                    .layer  = memory_layer_kind::fact,
                                    .key    = "test-coverage",
                                    .actual = 85.0};
    auto response = memory.execute(check, ctx);
    expect(response.found);
    expect(response.validation.has_value() && response.validation->is_valid);

    check.actual = 50.0;
    response     = memory.execute(check, ctx);
    expect(!response.found);
    expect(!response.validation->is_valid);
  };

  return 0;
}
