/***
 * Name: terse::collections (for_each)
 * Purpose: Iterate a sequence, an indexed sequence, or a repeat count.
 * Inputs: Sequence or count, and a body callable
 * Outputs: None; bodies act through captured state
 * Theory of Operation: Traversal is left to right. Any value returned by the
 *   body is discarded. Repeat rejects negative counts with InvalidArgumentError.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace terse {
namespace collections {

template <typename Seq, typename Body>
void ForEach(const Seq& seq, Body body) {
  for (const auto& item : seq) {
    static_cast<void>(body(item));
  }
}

/*** ForEachIndexed: body(index, element) with a zero-based index. */
template <typename Seq, typename Body>
void ForEachIndexed(const Seq& seq, Body body) {
  std::size_t index = 0;
  for (const auto& item : seq) {
    static_cast<void>(body(index, item));
    ++index;
  }
}

/*** Repeat: body(i) for i in [0, count). */
void Repeat(std::int64_t count, const std::function<void(std::int64_t)>& body);

/*** Repeat: run a nullary body count times. */
void Repeat(std::int64_t count, const std::function<void()>& body);

}  // namespace collections
}  // namespace terse
