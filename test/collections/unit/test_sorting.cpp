/***
 * Name: terse::tests::Sorting
 * Purpose: Validate SortedBy/Sorted ordering, stability and that inputs are untouched.
 */
#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "terse/collections/sorting.h"

using namespace terse::collections;

TEST(Sorting, AscendingAndDescending) {
  const std::vector<int> input{3, 1, 2};
  EXPECT_EQ((std::vector<int>{1, 2, 3}), SortedBy(input, std::less<>()));
  EXPECT_EQ((std::vector<int>{3, 2, 1}), SortedBy(input, std::greater<>()));
  EXPECT_EQ((std::vector<int>{1, 2, 3}), Sorted(input));
  EXPECT_EQ((std::vector<int>{3, 1, 2}), input);
}

TEST(Sorting, IsStable) {
  using Entry = std::pair<int, std::string>;
  const std::vector<Entry> input{{2, "b"}, {1, "x"}, {2, "a"}, {1, "y"}, {2, "c"}};
  const auto sorted = SortedBy(input, [](const Entry& l, const Entry& r) { return l.first < r.first; });
  const std::vector<Entry> expected{{1, "x"}, {1, "y"}, {2, "b"}, {2, "a"}, {2, "c"}};
  EXPECT_EQ(expected, sorted);
}

TEST(Sorting, EmptyAndSingle) {
  EXPECT_TRUE(Sorted(std::vector<double>{}).empty());
  EXPECT_EQ((std::vector<std::string>{"only"}), Sorted(std::vector<std::string>{"only"}));
}
