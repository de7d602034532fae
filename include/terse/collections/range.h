/***
 * Name: terse::collections::Range
 * Purpose: Half-open interval [lower, upper) over an ordered type, iterable for integers.
 * Inputs: Lower and upper bounds
 * Outputs: Range value usable with ForEach, Mapped, IsNotEmpty and Defaultable
 * Theory of Operation:
 *   A range whose upper bound does not exceed its lower bound is empty.
 *   Closed(lo, hi) builds the half-open equivalent of [lo, hi] for integers.
 *   Iteration is provided only for integral bounds.
 */
#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace terse {
namespace collections {

template <typename T>
class Range {
 public:
  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T*;
    using reference = T;

    Iterator() = default;
    explicit Iterator(T value) : value_(value) {}

    T operator*() const { return value_; }
    Iterator& operator++() {
      ++value_;
      return *this;
    }
    Iterator operator++(int) {
      Iterator prev = *this;
      ++value_;
      return prev;
    }
    bool operator==(const Iterator& other) const { return value_ == other.value_; }
    bool operator!=(const Iterator& other) const { return value_ != other.value_; }

   private:
    T value_{};
  };

  Range() = default;
  Range(T lower, T upper) : lower_(lower), upper_(upper) {}

  static Range Closed(T lower, T upper) {
    static_assert(std::is_integral_v<T>, "closed ranges require integral bounds");
    return Range(lower, static_cast<T>(upper + 1));
  }

  const T& lower() const { return lower_; }
  const T& upper() const { return upper_; }

  bool empty() const { return !(lower_ < upper_); }
  bool Contains(const T& value) const { return !(value < lower_) && value < upper_; }

  std::size_t size() const {
    static_assert(std::is_integral_v<T>, "size requires integral bounds");
    return empty() ? 0U : static_cast<std::size_t>(upper_ - lower_);
  }

  Iterator begin() const {
    static_assert(std::is_integral_v<T>, "iteration requires integral bounds");
    return Iterator(lower_);
  }
  Iterator end() const {
    static_assert(std::is_integral_v<T>, "iteration requires integral bounds");
    return Iterator(empty() ? lower_ : upper_);
  }

  bool operator==(const Range& other) const { return lower_ == other.lower_ && upper_ == other.upper_; }

 private:
  T lower_{};
  T upper_{};
};

}  // namespace collections
}  // namespace terse
