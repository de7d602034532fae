/***
 * Name: terse::collections (mapping)
 * Purpose: Element-wise transformation of a sequence into a new vector.
 * Inputs: Any iterable sequence and a unary transform
 * Outputs: std::vector of transform results
 * Theory of Operation:
 *   Mapped visits elements left to right and keeps every result, so the output
 *   has the input's length and order. CompactMapped expects the transform to
 *   return std::optional and drops empty results.
 */
#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "terse/collections/sequence_traits.h"

namespace terse {
namespace collections {

template <typename Seq, typename Fn>
auto Mapped(const Seq& seq, Fn fn) -> std::vector<detail::ResultOf<Seq, Fn>> {
  std::vector<detail::ResultOf<Seq, Fn>> out;
  for (const auto& item : seq) {
    out.push_back(fn(item));
  }
  return out;
}

template <typename Seq, typename Fn>
auto CompactMapped(const Seq& seq, Fn fn) -> std::vector<typename detail::ResultOf<Seq, Fn>::value_type> {
  static_assert(std::is_same_v<detail::ResultOf<Seq, Fn>,
                               std::optional<typename detail::ResultOf<Seq, Fn>::value_type>>,
                "CompactMapped requires a transform returning std::optional");
  std::vector<typename detail::ResultOf<Seq, Fn>::value_type> out;
  for (const auto& item : seq) {
    auto result = fn(item);
    if (result.has_value()) {
      out.push_back(std::move(*result));
    }
  }
  return out;
}

}  // namespace collections
}  // namespace terse
