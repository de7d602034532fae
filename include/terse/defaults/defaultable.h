/***
 * Name: terse::defaults::Defaultable
 * Purpose: Type-appropriate "zero" values, and coalescing of empty optionals to them.
 * Inputs: Template type parameter
 * Outputs: Defaultable<T>::Value() returning a fresh default of T
 * Theory of Operation:
 *   One specialization per supported family: arithmetic types (0, false for
 *   bool), strings and string views (empty), standard containers (empty),
 *   chrono durations (zero), system_clock time points (the Unix epoch) and
 *   Range<T> (an empty range at T's default). The primary template is left
 *   undefined so that coalescing an unsupported type fails to compile.
 */
#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "terse/collections/range.h"

namespace terse {
namespace defaults {

template <typename T, typename Enable = void>
struct Defaultable;

template <typename T>
struct Defaultable<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
  static constexpr T Value() { return T{}; }
};

template <typename C, typename Tr, typename A>
struct Defaultable<std::basic_string<C, Tr, A>> {
  static std::basic_string<C, Tr, A> Value() { return {}; }
};

template <typename C, typename Tr>
struct Defaultable<std::basic_string_view<C, Tr>> {
  static constexpr std::basic_string_view<C, Tr> Value() { return {}; }
};

template <typename T, typename A>
struct Defaultable<std::vector<T, A>> {
  static std::vector<T, A> Value() { return {}; }
};

template <typename K, typename V, typename C, typename A>
struct Defaultable<std::map<K, V, C, A>> {
  static std::map<K, V, C, A> Value() { return {}; }
};

template <typename K, typename V, typename H, typename E, typename A>
struct Defaultable<std::unordered_map<K, V, H, E, A>> {
  static std::unordered_map<K, V, H, E, A> Value() { return {}; }
};

template <typename K, typename C, typename A>
struct Defaultable<std::set<K, C, A>> {
  static std::set<K, C, A> Value() { return {}; }
};

template <typename K, typename H, typename E, typename A>
struct Defaultable<std::unordered_set<K, H, E, A>> {
  static std::unordered_set<K, H, E, A> Value() { return {}; }
};

template <typename Rep, typename Period>
struct Defaultable<std::chrono::duration<Rep, Period>> {
  static constexpr std::chrono::duration<Rep, Period> Value() { return std::chrono::duration<Rep, Period>::zero(); }
};

template <typename Duration>
struct Defaultable<std::chrono::time_point<std::chrono::system_clock, Duration>> {
  // system_clock measures from the Unix epoch, so the zero time point is 1970-01-01T00:00:00Z.
  static constexpr std::chrono::time_point<std::chrono::system_clock, Duration> Value() { return {}; }
};

template <typename T>
struct Defaultable<collections::Range<T>> {
  static collections::Range<T> Value() {
    return collections::Range<T>(Defaultable<T>::Value(), Defaultable<T>::Value());
  }
};

/*** Coalesce: the contained value, or Defaultable<T>::Value() when empty. */
template <typename T>
T Coalesce(const std::optional<T>& value) {
  if (value.has_value()) {
    return *value;
  }
  return Defaultable<T>::Value();
}

}  // namespace defaults
}  // namespace terse
