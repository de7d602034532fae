/***
 * Name: terse::collections::detail (sequence traits)
 * Purpose: Element-type deduction shared by the sequence combinators.
 */
#pragma once

#include <iterator>
#include <type_traits>
#include <utility>

namespace terse::collections::detail {

/*** Value type of the elements produced by iterating `Seq`. */
template <typename Seq>
using ElementOf = std::remove_cvref_t<decltype(*std::begin(std::declval<const Seq&>()))>;

/*** Decayed result of invoking `Fn` on one element of `Seq`. */
template <typename Seq, typename Fn>
using ResultOf = std::decay_t<std::invoke_result_t<Fn&, const ElementOf<Seq>&>>;

}  // namespace terse::collections::detail
