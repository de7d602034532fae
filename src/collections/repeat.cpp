/***
 * Name: terse::collections::Repeat
 * Purpose: Call a body a fixed number of times.
 * Inputs:
 *   - count: number of iterations (must not be negative)
 *   - body: callable receiving the iteration index, or a nullary callable
 * Outputs: None
 * Theory of Operation: Counts upward from zero; a negative count cannot be
 *   iterated and raises InvalidArgumentError before the body runs.
 */
#include "terse/collections/for_each.h"

#include <string>

#include "terse/exceptions/invalid_argument_error.h"

namespace terse::collections {

void Repeat(std::int64_t count, const std::function<void(std::int64_t)>& body) {
  if (count < 0) {
    throw exceptions::InvalidArgumentError("cannot iterate over a negative interval (count " +
                                           std::to_string(count) + ")");
  }
  for (std::int64_t index = 0; index < count; ++index) {
    body(index);
  }
}

void Repeat(std::int64_t count, const std::function<void()>& body) {
  Repeat(count, [&body](std::int64_t) { body(); });
}

}  // namespace terse::collections
