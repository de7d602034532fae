/***
 * Name: terse::strings::Describe
 * Purpose: Convert values to their display string.
 * Inputs: Any supported value (scalars, strings, optionals, pairs, sequences, maps, streamables)
 * Outputs: std::string
 * Theory of Operation:
 *   Dispatch on the value's type at compile time.
 *   - bool prints true/false; integers print in decimal; chars print as themselves.
 *   - Floating point values use the shortest representation that round-trips,
 *     with ".0" appended to integral values and nan/inf/-inf spelled out.
 *   - Strings print verbatim at the top level and double-quoted inside containers.
 *   - Optionals print their value or "nil"; pairs print as "(a, b)".
 *   - Sequences print as "[a, b, c]"; sequences of pairs (maps) as "[k: v]",
 *     with "[:]" for an empty map.
 *   - Anything else with an operator<< is streamed.
 */
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace terse {
namespace strings {

std::string DescribeFloatingPoint(double value);
std::string DescribeFloatingPoint(float value);

namespace detail {

template <typename>
inline constexpr bool kAlwaysFalse = false;

template <typename T, typename = void>
struct IsIterable : std::false_type {};

template <typename T>
struct IsIterable<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                 decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
struct IsPair : std::false_type {};

template <typename A, typename B>
struct IsPair<std::pair<A, B>> : std::true_type {};

template <typename T, typename = void>
struct IsStreamable : std::false_type {};

template <typename T>
struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template <typename T>
inline constexpr bool kIsStringLike = std::is_convertible_v<const T&, std::string_view>;

template <typename T>
std::string DescribeNested(const T& value);

}  // namespace detail

template <typename T>
std::string Describe(const T& value) {
  if constexpr (std::is_same_v<T, bool>) {
    return value ? "true" : "false";
  } else if constexpr (std::is_floating_point_v<T>) {
    if constexpr (std::is_same_v<T, float>) {
      return DescribeFloatingPoint(value);
    } else {
      return DescribeFloatingPoint(static_cast<double>(value));
    }
  } else if constexpr (std::is_same_v<T, char>) {
    return std::string(1, value);
  } else if constexpr (std::is_integral_v<T>) {
    return std::to_string(value);
  } else if constexpr (detail::kIsStringLike<T>) {
    return std::string(std::string_view(value));
  } else if constexpr (detail::IsOptional<T>::value) {
    return value.has_value() ? Describe(*value) : std::string("nil");
  } else if constexpr (detail::IsPair<T>::value) {
    return "(" + detail::DescribeNested(value.first) + ", " + detail::DescribeNested(value.second) + ")";
  } else if constexpr (detail::IsIterable<T>::value) {
    using Element = std::remove_cvref_t<decltype(*std::begin(value))>;
    std::string out = "[";
    std::size_t count = 0;
    for (const auto& item : value) {
      if (count++ != 0) out += ", ";
      if constexpr (detail::IsPair<Element>::value) {
        out += detail::DescribeNested(item.first) + ": " + detail::DescribeNested(item.second);
      } else {
        out += detail::DescribeNested(item);
      }
    }
    if constexpr (detail::IsPair<Element>::value) {
      if (count == 0) out += ":";
    }
    out += "]";
    return out;
  } else if constexpr (detail::IsStreamable<T>::value) {
    std::ostringstream stream;
    stream << value;
    return stream.str();
  } else {
    static_assert(detail::kAlwaysFalse<T>, "Describe: no string conversion for this type");
  }
}

namespace detail {

// Strings and characters are quoted when they appear inside a container.
template <typename T>
std::string DescribeNested(const T& value) {
  if constexpr (std::is_same_v<T, char>) {
    return "\"" + std::string(1, value) + "\"";
  } else if constexpr (kIsStringLike<T>) {
    return "\"" + std::string(std::string_view(value)) + "\"";
  } else if constexpr (IsOptional<T>::value) {
    return value.has_value() ? DescribeNested(*value) : std::string("nil");
  } else {
    return Describe(value);
  }
}

}  // namespace detail

}  // namespace strings
}  // namespace terse
