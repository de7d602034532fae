/***
 * Name: terse::collections (sorting)
 * Purpose: Stable sort of a sequence into a new vector.
 * Inputs: Any iterable sequence and an "are in increasing order" predicate
 * Outputs: Sorted std::vector; the input is untouched
 * Theory of Operation: std::stable_sort, so elements the predicate considers
 *   equal keep their relative order.
 */
#pragma once

#include <algorithm>
#include <functional>
#include <iterator>
#include <vector>

#include "terse/collections/sequence_traits.h"

namespace terse {
namespace collections {

template <typename Seq, typename Compare>
auto SortedBy(const Seq& seq, Compare are_in_increasing_order) -> std::vector<detail::ElementOf<Seq>> {
  std::vector<detail::ElementOf<Seq>> out(std::begin(seq), std::end(seq));
  std::stable_sort(out.begin(), out.end(), are_in_increasing_order);
  return out;
}

template <typename Seq>
auto Sorted(const Seq& seq) -> std::vector<detail::ElementOf<Seq>> {
  return SortedBy(seq, std::less<>{});
}

}  // namespace collections
}  // namespace terse
