/*** terse::collections::IsNotEmpty: negation of std::empty for containers, strings and views. */
#pragma once

#include <iterator>

namespace terse {
namespace collections {

template <typename C>
constexpr bool IsNotEmpty(const C& container) {
  return !std::empty(container);
}

}  // namespace collections
}  // namespace terse
