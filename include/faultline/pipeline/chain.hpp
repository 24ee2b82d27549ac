#pragma once

/** \file chain.hpp
 *  \brief Fail-fast composition of fallible steps.
 *
 * Semantics:
 * - Steps run strictly left to right; step i+1 receives the success value of step i.
 * - The first failing step ends evaluation; no later step is invoked.
 * - A failure that is not already a core::error is converted through the one-argument
 *   core::to_error overloads: int_parse_failure, float_parse_failure, math::domain_error.
 *   std::error_code needs the path it relates to, so storage steps convert it themselves
 *   (core::to_error(ec, path, component)) and return expected<T, core::error>.
 * - chain(x) with no steps returns x.
 *
 * Two forms:
 * - chain(input, steps...): steps fixed at compile time, each may change the value type.
 * - step_sequence<T>: steps appended at run time, all of type T -> expected<T, error>.
 */

#include <cstddef>
#include <functional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "faultline/error.hpp"
#include "faultline/error_mapping.hpp"
#include "faultline/expected.hpp"

namespace faultline::pipeline {

namespace detail {

template <class R> struct is_expected : std::false_type {};
template <class T, class E> struct is_expected<std::expected<T, E>> : std::true_type {};

/** \brief Canonicalize a step result to expected<T, core::error>. */
template <class T, class E>
auto lift(std::expected<T, E>&& r) -> std::expected<T, core::error> {
  static_assert(!std::is_void_v<T>, "pipeline steps must produce a value for the next step");
  if constexpr (std::is_same_v<E, core::error>) {
    return std::move(r);
  } else {
    static_assert(!std::is_same_v<E, std::error_code>,
                  "convert std::error_code with core::to_error(ec, path) inside the step");
    if (!r) return std::unexpected(core::to_error(std::move(r).error()));
    return std::move(*r);
  }
}

} // namespace detail

/** \brief Identity: a chain of length 0. */
template <class T>
auto chain(T&& value) -> std::expected<std::decay_t<T>, core::error> {
  return std::forward<T>(value);
}

/** \brief Run `step` on `value`, then the remaining steps on its success value. */
template <class T, class Step, class... Rest>
auto chain(T&& value, Step&& step, Rest&&... rest) {
  using step_result = std::invoke_result_t<Step, T>;
  static_assert(detail::is_expected<std::decay_t<step_result>>::value,
                "pipeline steps must return std::expected");
  using value_type = typename std::decay_t<step_result>::value_type;
  using result_type = decltype(chain(std::declval<value_type>(), std::declval<Rest>()...));

  auto r = detail::lift(std::invoke(std::forward<Step>(step), std::forward<T>(value)));
  if (!r) return result_type(std::unexpect, std::move(r).error());
  return chain(std::move(*r), std::forward<Rest>(rest)...);
}

/** \brief Run-time sequence of same-typed steps. */
template <class T>
class step_sequence {
public:
  using step_type = std::function<std::expected<T, core::error>(T)>;

  auto then(step_type step) -> step_sequence& {
    steps_.push_back(std::move(step));
    return *this;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return steps_.size(); }

  /** \brief Evaluate every step in order, stopping at the first failure. */
  auto run(T input) const -> std::expected<T, core::error> {
    T current = std::move(input);
    for (const auto& step : steps_) {
      auto r = step(std::move(current));
      if (!r) return std::unexpected(std::move(r).error());
      current = std::move(*r);
    }
    return current;
  }

private:
  std::vector<step_type> steps_;
};

} // namespace faultline::pipeline
