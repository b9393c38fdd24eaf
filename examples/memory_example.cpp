#include <iostream>
#include <loom/memory.hpp>
#include <string>

using namespace loom::memory;

auto main() -> int {
  auto layers = memory_layers::in_process();
  layers.facts->register_fact(fact{.key       = "test-coverage",
                                   .value     = 80.0,
                                   .category  = "quality",
                                   .rationale = "untested code regresses",
                                   .op        = constraint_op::ge});
  auto memory = make_memory(layers);

  loom::primitives::context ctx{loom::primitives::context::options{.session_id = "demo"}};

  memory_request remember{.op = memory_operation::add, .layer = memory_layer_kind::deep};
  remember.record.key     = "db-choice";
  remember.record.content = "postgres chosen for the billing service";
  remember.record.tags    = {"architecture"};
  memory->execute(remember, ctx);

  memory_request search{.op = memory_operation::search, .layer = memory_layer_kind::deep};
  search.query.text = "billing postgres";
  for (const auto& record : memory->execute(search, ctx).records) {
    std::cout << record.key << ": " << record.content << '\n';
  }

  memory_request check{.op     = memory_operation::validate,
                       .layer  = memory_layer_kind::fact,
                       .key    = "test-coverage",
                       .actual = 72.5};
  auto verdict = memory->execute(check, ctx).validation;
  if (verdict) {
    std::cout << verdict->message << '\n';
  }
  return 0;
}
