/***
 * Name: terse::collections::Filtered
 * Purpose: Keep the elements of a sequence that satisfy a predicate.
 * Inputs: Any iterable sequence and a unary predicate
 * Outputs: std::vector of the matching elements, in their original relative order
 * Theory of Operation: Single left-to-right pass; an empty vector when nothing matches.
 */
#pragma once

#include <vector>

#include "terse/collections/sequence_traits.h"

namespace terse {
namespace collections {

template <typename Seq, typename Pred>
auto Filtered(const Seq& seq, Pred is_included) -> std::vector<detail::ElementOf<Seq>> {
  std::vector<detail::ElementOf<Seq>> out;
  for (const auto& item : seq) {
    if (is_included(item)) {
      out.push_back(item);
    }
  }
  return out;
}

}  // namespace collections
}  // namespace terse
