/***
 * Name: terse::tests::FilteringReducing
 * Purpose: Validate Filtered ordering and emptiness, and Reduced with explicit and default seeds.
 */
#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

#include "terse/collections/filtering.h"
#include "terse/collections/reducing.h"

using namespace terse::collections;

TEST(Filtering, PreservesRelativeOrder) {
  const std::vector<int> input{9, 2, 7, 4, 5, 6};
  EXPECT_EQ((std::vector<int>{2, 4, 6}), Filtered(input, [](int v) { return v % 2 == 0; }));
}

TEST(Filtering, NoMatchGivesEmpty) {
  const std::vector<int> input{1, 3, 5};
  EXPECT_TRUE(Filtered(input, [](int v) { return v > 10; }).empty());
}

TEST(Filtering, AllMatchGivesCopy) {
  const std::vector<std::string> input{"x", "y"};
  EXPECT_EQ(input, Filtered(input, [](const std::string&) { return true; }));
}

TEST(Reducing, SumWithInitial) {
  const std::vector<int> numbers{1, 2, 3, 4};
  EXPECT_EQ(10, Reduced(numbers, 0, [](int x, int y) { return x + y; }));
  EXPECT_EQ(13, Reduced(numbers, 3, std::plus<>()));
}

TEST(Reducing, EmptySequenceReturnsInitial) {
  const std::vector<int> empty;
  EXPECT_EQ(42, Reduced(empty, 42, std::plus<>()));
  EXPECT_EQ(0, Reduced<int>(empty, std::plus<>()));
  EXPECT_EQ("", Reduced<std::string>(std::vector<std::string>{}, std::plus<>()));
}

TEST(Reducing, DefaultSeedFromDefaultable) {
  const std::vector<std::string> parts{"ter", "se"};
  EXPECT_EQ("terse", Reduced<std::string>(parts, std::plus<>()));
  const std::vector<double> values{0.5, 0.25};
  EXPECT_DOUBLE_EQ(0.75, Reduced<double>(values, std::plus<>()));
}

TEST(Reducing, FoldsLeftToRight) {
  const std::vector<int> numbers{1, 2, 3};
  const std::string trace = Reduced(numbers, std::string("s"), [](std::string acc, int v) {
    return "(" + acc + "+" + std::to_string(v) + ")";
  });
  EXPECT_EQ("(((s+1)+2)+3)", trace);
}

TEST(Reducing, AccumulatorTypeDiffersFromElement) {
  const std::vector<std::string> words{"a", "bb", "ccc"};
  EXPECT_EQ(6u, Reduced(words, std::size_t{0}, [](std::size_t acc, const std::string& w) { return acc + w.size(); }));
}
