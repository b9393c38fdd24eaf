#pragma once

#include <concepts>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// fallback - primary first, then each alternative in order
// ============================================================================
//
// Only a thrown exception moves on to the next alternative. A primary that
// returns a value describing a failure is a success here; convert such results
// into an exception upstream if they should trigger the chain.

struct fallback_options {
  std::string name = "fallback";
  sink_ptr    sink;
};

template <class In, class Out>
class fallback_primitive final : public primitive<In, Out> {
 public:
  fallback_primitive(primitive_ptr<In, Out> primary,
                     std::vector<primitive_ptr<In, Out>> alternatives, fallback_options opts = {})
      : primitive<In, Out>(std::move(opts.name), std::move(opts.sink)),
        primary_(std::move(primary)),
        alternatives_(std::move(alternatives)) {
    if (!primary_) {
      throw configuration_error("fallback '" + this->name() + "' has no primary");
    }
    if (alternatives_.empty()) {
      throw configuration_error("fallback '" + this->name() + "' has no alternatives");
    }
    for (const auto& alt : alternatives_) {
      if (!alt) {
        throw configuration_error("fallback '" + this->name() + "' has a null alternative");
      }
    }
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    try {
      return primary_->execute(In(input), ctx);
    } catch (...) {
      logger()->info("{} primary '{}' failed, trying alternatives: {}", this->name(),
                     primary_->name(), describe(std::current_exception()));
    }

    for (std::size_t i = 0; i < alternatives_.size(); ++i) {
      const auto& alt  = alternatives_[i];
      const bool  last = i + 1 == alternatives_.size();
      this->emit(ctx, "fallback_activated", {{"alternative", alt->name()}});
      this->count("fallback.activations");
      if (last) {
        return alt->execute(std::move(input), ctx);
      }
      try {
        return alt->execute(In(input), ctx);
      } catch (...) {
        logger()->info("{} alternative '{}' failed: {}", this->name(), alt->name(),
                       describe(std::current_exception()));
      }
    }
    throw configuration_error("fallback '" + this->name() + "' has no alternatives");
  }

 private:
  primitive_ptr<In, Out>              primary_;
  std::vector<primitive_ptr<In, Out>> alternatives_;
};

template <primitive_handle H, primitive_handle... Alts>
  requires(std::same_as<input_of_t<H>, input_of_t<Alts>> && ...)
          && (std::same_as<output_of_t<H>, output_of_t<Alts>> && ...)
auto fallback_of(H&& primary, Alts&&... alternatives) {
  using in_t  = input_of_t<H>;
  using out_t = output_of_t<H>;
  std::vector<primitive_ptr<in_t, out_t>> alts{as_primitive(std::forward<Alts>(alternatives))...};
  return as_primitive(std::make_shared<fallback_primitive<in_t, out_t>>(
      as_primitive(std::forward<H>(primary)), std::move(alts)));
}

}  // namespace loom::primitives
