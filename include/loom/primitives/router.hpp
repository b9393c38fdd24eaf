#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "context.hpp"
#include "errors.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// router - runs exactly one route chosen per input
// ============================================================================

template <class In>
using route_fn = std::function<std::string(const In&, const context&)>;

struct router_options {
  std::string                name = "router";
  // Route used when the selector returns an unknown key.
  std::optional<std::string> default_route;
  sink_ptr                   sink;
};

template <class In, class Out>
class router final : public primitive<In, Out> {
 public:
  router(route_fn<In> select, std::map<std::string, primitive_ptr<In, Out>> routes,
         router_options opts = {})
      : primitive<In, Out>(std::move(opts.name), std::move(opts.sink)),
        select_(std::move(select)),
        routes_(std::move(routes)),
        default_route_(std::move(opts.default_route)) {
    if (!select_) {
      throw configuration_error("router '" + this->name() + "' has no route selector");
    }
    if (routes_.empty()) {
      throw configuration_error("router '" + this->name() + "' has no routes");
    }
    for (const auto& [key, route] : routes_) {
      if (!route) {
        throw configuration_error("router '" + this->name() + "' route '" + key + "' is null");
      }
    }
    if (default_route_ && !routes_.contains(*default_route_)) {
      throw configuration_error("router '" + this->name() + "' default route '" + *default_route_
                                + "' is not a configured route");
    }
  }

  [[nodiscard]] std::vector<std::string> route_names() const {
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto& [key, route] : routes_) {
      names.push_back(key);
    }
    return names;
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    const std::string key = select_(input, ctx);

    auto it = routes_.find(key);
    if (it == routes_.end()) {
      if (!default_route_) {
        throw routing_error("router '" + this->name() + "' has no route '" + key
                            + "' and no default");
      }
      this->emit(ctx, "route_defaulted", {{"requested", key}, {"route", *default_route_}});
      it = routes_.find(*default_route_);
    } else {
      this->emit(ctx, "route_selected", {{"route", key}});
    }

    ctx.state().set("router.route", it->first);
    return it->second->execute(std::move(input), ctx);
  }

 private:
  route_fn<In>                                   select_;
  std::map<std::string, primitive_ptr<In, Out>> routes_;
  std::optional<std::string>                     default_route_;
};

template <class In, class Out>
primitive_ptr<In, Out> route_by(route_fn<In> select,
                                std::map<std::string, primitive_ptr<In, Out>> routes,
                                router_options opts = {}) {
  return as_primitive(
      std::make_shared<router<In, Out>>(std::move(select), std::move(routes), std::move(opts)));
}

}  // namespace loom::primitives
