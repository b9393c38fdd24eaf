#pragma once

#include <any>
#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "context.hpp"
#include "errors.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// sequential - ordered chain, each output piped into the next step
// ============================================================================

namespace _sequential_detail {

// A step with its input and output types erased, so chains of any length and
// any intermediate types live in one flat list. Intermediate values must be
// copy constructible (std::any).
struct step {
  std::string                                  name;
  std::function<std::any(std::any, context&)> run;
};

template <class In, class Out>
step erase(primitive_ptr<In, Out> p) {
  if (!p) {
    throw configuration_error("sequence step is null");
  }
  std::string name = p->name();
  return {std::move(name), [p = std::move(p)](std::any input, context& ctx) -> std::any {
            return std::any(p->execute(std::any_cast<In>(std::move(input)), ctx));
          }};
}

template <class... Hs>
inline constexpr bool chains = true;

template <class A, class B, class... Rest>
inline constexpr bool chains<A, B, Rest...> =
    std::same_as<output_of_t<A>, input_of_t<B>> && chains<B, Rest...>;

template <class... Ts>
using last_t = std::tuple_element_t<sizeof...(Ts) - 1, std::tuple<Ts...>>;

}  // namespace _sequential_detail

template <class In, class Out>
class sequential final : public primitive<In, Out> {
 public:
  using step = _sequential_detail::step;

  sequential(std::string name, std::vector<step> steps, sink_ptr sink = nullptr)
      : primitive<In, Out>(std::move(name), std::move(sink)), steps_(std::move(steps)) {
    if (steps_.empty()) {
      throw configuration_error("sequential '" + this->name() + "' has no steps");
    }
  }

  // Homogeneous chain, e.g. a list of transforms over one type.
  sequential(std::string name, const std::vector<primitive_ptr<In, Out>>& steps,
             sink_ptr sink = nullptr)
    requires std::same_as<In, Out>
      : sequential(std::move(name), erase_all(steps), std::move(sink)) {}

  [[nodiscard]] const std::vector<step>& steps() const noexcept {
    return steps_;
  }

  [[nodiscard]] std::vector<std::string> step_names() const {
    std::vector<std::string> names;
    names.reserve(steps_.size());
    for (const auto& s : steps_) {
      names.push_back(s.name);
    }
    return names;
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    std::any current(std::move(input));
    for (const auto& s : steps_) {
      current = s.run(std::move(current), ctx);
    }
    return std::any_cast<Out>(std::move(current));
  }

 private:
  static std::vector<step> erase_all(const std::vector<primitive_ptr<In, Out>>& steps) {
    std::vector<step> erased;
    erased.reserve(steps.size());
    for (const auto& p : steps) {
      erased.push_back(_sequential_detail::erase(p));
    }
    return erased;
  }

  std::vector<step> steps_;
};

namespace _sequential_detail {

// Steps contributed by one operand: a nested chain is spliced in place.
template <class In, class Out>
void append(std::vector<step>& out, const primitive_ptr<In, Out>& p) {
  if (auto chain = std::dynamic_pointer_cast<sequential<In, Out>>(p)) {
    out.insert(out.end(), chain->steps().begin(), chain->steps().end());
  } else {
    out.push_back(erase(p));
  }
}

}  // namespace _sequential_detail

// sequence_of(a, b, c) runs a, then b on a's output, then c on b's output.
template <primitive_handle First, primitive_handle... Rest>
  requires _sequential_detail::chains<First, Rest...>
auto sequence_of(First&& first, Rest&&... rest) {
  using in_t  = input_of_t<First>;
  using out_t = output_of_t<_sequential_detail::last_t<First, Rest...>>;

  std::vector<_sequential_detail::step> steps;
  _sequential_detail::append(steps, as_primitive(std::forward<First>(first)));
  (_sequential_detail::append(steps, as_primitive(std::forward<Rest>(rest))), ...);
  return as_primitive(std::make_shared<sequential<in_t, out_t>>("sequential", std::move(steps)));
}

template <primitive_handle A, primitive_handle B>
  requires _sequential_detail::chains<A, B>
auto operator>>(A&& a, B&& b) {
  return sequence_of(std::forward<A>(a), std::forward<B>(b));
}

}  // namespace loom::primitives
