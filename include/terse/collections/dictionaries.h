/***
 * Name: terse::collections::ValueOr
 * Purpose: Dictionary lookup that falls back to a default value.
 * Inputs: Associative container, key, fallback
 * Outputs: The stored value when present and of the requested type; otherwise the fallback
 * Theory of Operation:
 *   For maps of std::any the stored value must hold exactly T; a value of
 *   another type is treated like a missing key. Other maps convert the stored
 *   value to T.
 */
#pragma once

#include <any>
#include <type_traits>
#include <utility>

namespace terse {
namespace collections {

template <typename Map, typename Key, typename T>
T ValueOr(const Map& map, const Key& key, T fallback) {
  const auto found = map.find(key);
  if (found == map.end()) {
    return fallback;
  }
  if constexpr (std::is_same_v<typename Map::mapped_type, std::any>) {
    if (const T* typed = std::any_cast<T>(&found->second)) {
      return *typed;
    }
    return fallback;
  } else {
    static_assert(std::is_convertible_v<const typename Map::mapped_type&, T>,
                  "ValueOr fallback type must accept the mapped type");
    return static_cast<T>(found->second);
  }
}

}  // namespace collections
}  // namespace terse
