/***
 * Name: terse::tests::Powers
 * Purpose: Validate Power, squaring/cubing, absolute value and truncating remainder.
 */
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>

#include "terse/math/powers.h"

using namespace terse::math;

TEST(Powers, PowerMatchesPow) {
  EXPECT_DOUBLE_EQ(81.0, Power(3.0, 4.0));
  EXPECT_DOUBLE_EQ(0.125, Power(2.0, -3.0));
  EXPECT_DOUBLE_EQ(std::pow(2.0, 0.5), Power(2.0, 0.5));
  EXPECT_DOUBLE_EQ(1.0, Power(0.0, 0.0));
  EXPECT_TRUE(std::isnan(Power(-8.0, 1.0 / 3.0)));
}

TEST(Powers, SquaredAndCubed) {
  EXPECT_EQ(16, Squared(4));
  EXPECT_EQ(64, Cubed(4));
  EXPECT_EQ(-27, Cubed(-3));
  EXPECT_DOUBLE_EQ(2.25, Squared(1.5));
  static_assert(Squared(std::int64_t{3}) == 9);
}

TEST(Powers, FormSquareAndCubeMutateInPlace) {
  int value = 3;
  FormSquare(value);
  EXPECT_EQ(9, value);
  FormCube(value);
  EXPECT_EQ(729, value);
}

TEST(Powers, Abs) {
  EXPECT_EQ(42, Abs(-42));
  EXPECT_EQ(42, Abs(42));
  EXPECT_DOUBLE_EQ(0.5, Abs(-0.5));
  EXPECT_EQ(0, Abs(0));
}

TEST(Powers, TruncatingRemainderKeepsDividendSign) {
  EXPECT_DOUBLE_EQ(1.5, TruncatingRemainder(7.5, 2.0));
  EXPECT_DOUBLE_EQ(-1.5, TruncatingRemainder(-7.5, 2.0));
  EXPECT_DOUBLE_EQ(-1.0, TruncatingRemainder(-5.0, -2.0));
  EXPECT_TRUE(std::isnan(TruncatingRemainder(1.0, 0.0)));
}
