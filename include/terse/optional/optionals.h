/***
 * Name: terse::optional
 * Purpose: Helpers over std::optional: nil checks, nil removal, lifting closures, checked unwrap.
 * Inputs: std::optional values, sequences of optionals, unary callables
 * Outputs: bools, vectors of present values, lifted callables, unwrapped values
 * Theory of Operation:
 *   Unwrap is the one place a missing value fails loudly: it throws
 *   UnexpectedNilError instead of substituting a default (see
 *   defaults::Coalesce for the substituting variant).
 */
#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "terse/collections/sequence_traits.h"
#include "terse/exceptions/unexpected_nil_error.h"

namespace terse {
namespace optional {

template <typename T>
constexpr bool IsNil(const std::optional<T>& value) {
  return !value.has_value();
}

/*** RemoveNils: present values of a sequence of optionals, in order. */
template <typename Seq>
auto RemoveNils(const Seq& seq) -> std::vector<typename collections::detail::ElementOf<Seq>::value_type> {
  std::vector<typename collections::detail::ElementOf<Seq>::value_type> out;
  for (const auto& item : seq) {
    if (item.has_value()) {
      out.push_back(*item);
    }
  }
  return out;
}

/***
 * Name: terse::optional::Optionalize
 * Purpose: Lift a callable T -> U into std::optional<T> -> std::optional<U>.
 * Inputs: fn taking T
 * Outputs: Callable returning nullopt for nullopt input and fn(value) otherwise
 * Theory of Operation: The returned lambda owns a copy of fn.
 */
template <typename T, typename Fn>
auto Optionalize(Fn fn) {
  using U = std::decay_t<std::invoke_result_t<Fn&, const T&>>;
  return [fn = std::move(fn)](const std::optional<T>& value) mutable -> std::optional<U> {
    if (!value.has_value()) {
      return std::nullopt;
    }
    return fn(*value);
  };
}

template <typename T>
T& Unwrap(std::optional<T>& value) {
  if (!value.has_value()) {
    throw exceptions::UnexpectedNilError();
  }
  return *value;
}

template <typename T>
const T& Unwrap(const std::optional<T>& value) {
  if (!value.has_value()) {
    throw exceptions::UnexpectedNilError();
  }
  return *value;
}

template <typename T>
T Unwrap(std::optional<T>&& value) {
  if (!value.has_value()) {
    throw exceptions::UnexpectedNilError();
  }
  return std::move(*value);
}

}  // namespace optional
}  // namespace terse
