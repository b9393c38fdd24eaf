#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "deep.hpp"
#include "facts.hpp"
#include "loom/primitives/context.hpp"
#include "loom/primitives/errors.hpp"
#include "loom/primitives/primitive.hpp"
#include "session.hpp"
#include "types.hpp"

namespace loom::memory {

// ============================================================================
// memory_primitive - the four layers behind the primitive contract
// ============================================================================

enum class memory_operation { add, get, search, validate };

enum class memory_layer_kind { session, window, deep, fact };

inline constexpr std::string_view to_string(memory_layer_kind kind) noexcept {
  switch (kind) {
    case memory_layer_kind::session:
      return "session";
    case memory_layer_kind::window:
      return "window";
    case memory_layer_kind::deep:
      return "deep";
    case memory_layer_kind::fact:
      return "fact";
  }
  return "unknown";
}

inline constexpr std::string_view to_string(memory_operation op) noexcept {
  switch (op) {
    case memory_operation::add:
      return "add";
    case memory_operation::get:
      return "get";
    case memory_operation::search:
      return "search";
    case memory_operation::validate:
      return "validate";
  }
  return "unknown";
}

struct memory_request {
  memory_operation  op    = memory_operation::get;
  memory_layer_kind layer = memory_layer_kind::deep;
  // add
  memory_record record;
  // get, validate. For the session layer an empty key means the context's
  // session id.
  std::string key;
  // search
  search_query query;
  // validate
  fact_value actual;
};

struct memory_response {
  // get: the key was found. add: always true. validate: the result was valid.
  bool                             found = false;
  std::vector<memory_record>       records;
  std::optional<validation_result> validation;
};

struct memory_layers {
  std::shared_ptr<session_memory> session;
  std::shared_ptr<window_memory>  window;
  std::shared_ptr<deep_memory>    deep;
  std::shared_ptr<fact_registry>  facts;

  // Session, deep and fact layers in process, with a window of `span` over
  // the first two.
  static memory_layers in_process(std::chrono::system_clock::duration span = std::chrono::hours(1),
                                  std::shared_ptr<clock>              time = nullptr) {
    memory_layers layers;
    layers.session = std::make_shared<session_memory>(time);
    layers.deep    = std::make_shared<deep_memory>(nullptr, deep_options{}, time);
    layers.window  = std::make_shared<window_memory>(layers.session, layers.deep, span, time);
    layers.facts   = std::make_shared<fact_registry>();
    return layers;
  }
};

class memory_primitive final : public primitives::primitive<memory_request, memory_response> {
 public:
  explicit memory_primitive(memory_layers layers, std::string name = "memory",
                            primitives::sink_ptr sink = nullptr)
      : primitive(std::move(name), std::move(sink)), layers_(std::move(layers)) {
    if (!layers_.session || !layers_.window || !layers_.deep || !layers_.facts) {
      throw configuration_error("memory primitive needs all four layers");
    }
  }

  [[nodiscard]] const memory_layers& layers() const noexcept {
    return layers_;
  }

 protected:
  memory_response do_execute(memory_request request, primitives::context& ctx) override {
    memory_layer& layer = select(request.layer);
    if (request.layer == memory_layer_kind::session) {
      if (request.key.empty()) {
        request.key = ctx.session_id();
      }
      if (request.record.key.empty()) {
        request.record.key = ctx.session_id();
      }
    }

    memory_response response;
    switch (request.op) {
      case memory_operation::add:
        layer.add(std::move(request.record));
        response.found = true;
        break;
      case memory_operation::get:
        if (auto record = layer.get(request.key)) {
          response.found = true;
          response.records.push_back(std::move(*record));
        }
        break;
      case memory_operation::search:
        response.records = layer.search(request.query);
        response.found   = !response.records.empty();
        break;
      case memory_operation::validate:
        response.validation = layer.validate(request.key, request.actual);
        response.found      = response.validation->is_valid;
        break;
    }

    ctx.checkpoint(
        fmt::format("{}.{}.{}", name(), to_string(request.layer), to_string(request.op)));
    return response;
  }

 private:
  memory_layer& select(memory_layer_kind kind) const {
    switch (kind) {
      case memory_layer_kind::session:
        return *layers_.session;
      case memory_layer_kind::window:
        return *layers_.window;
      case memory_layer_kind::deep:
        return *layers_.deep;
      case memory_layer_kind::fact:
        return *layers_.facts;
    }
    throw configuration_error("unknown memory layer");
  }

  memory_layers layers_;
};

inline std::shared_ptr<memory_primitive> make_memory(memory_layers        layers,
                                                     std::string          name = "memory",
                                                     primitives::sink_ptr sink = nullptr) {
  return std::make_shared<memory_primitive>(std::move(layers), std::move(name), std::move(sink));
}

}  // namespace loom::memory
