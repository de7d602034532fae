/***
 * Name: terse::collections::Reduced
 * Purpose: Left fold of a sequence into a single accumulated value.
 * Inputs:
 *   - seq: any iterable sequence
 *   - initial: starting accumulator (or Defaultable<R>::Value() when omitted)
 *   - next_partial_result: (accumulator, element) -> accumulator
 * Outputs: Final accumulator; the initial value for an empty sequence
 * Theory of Operation: The accumulator is local to the call and is moved
 *   through each step.
 */
#pragma once

#include <utility>

#include "terse/defaults/defaultable.h"

namespace terse {
namespace collections {

template <typename Seq, typename T, typename Fn>
T Reduced(const Seq& seq, T initial, Fn next_partial_result) {
  T acc = std::move(initial);
  for (const auto& item : seq) {
    acc = next_partial_result(std::move(acc), item);
  }
  return acc;
}

/*** Reduced<R>: fold seeded with the type's default value. */
template <typename R, typename Seq, typename Fn>
R Reduced(const Seq& seq, Fn next_partial_result) {
  return Reduced(seq, defaults::Defaultable<R>::Value(), std::move(next_partial_result));
}

}  // namespace collections
}  // namespace terse
