/***
 * Name: terse::tests::Roots
 * Purpose: Validate Root and its fixed-degree shorthands, including negative radicands.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Check the worked examples exactly (to a few ULPs) and
 *   sweep radicands/degrees for the round-trip and sign properties.
 */
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "terse/math/roots.h"

using namespace terse::math;

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();
}  // namespace

TEST(Roots, WorkedExamples) {
  EXPECT_DOUBLE_EQ(3.0, Root(243.0, 5.0));
  EXPECT_DOUBLE_EQ(-3.0, Root(-243.0, 5.0));
  EXPECT_TRUE(std::isnan(Root(-64.0, 2.0)));
}

TEST(Roots, FixedDegrees) {
  EXPECT_DOUBLE_EQ(std::sqrt(2.0), SquareRoot(2.0));
  EXPECT_DOUBLE_EQ(2.0, CubeRoot(8.0));
  EXPECT_DOUBLE_EQ(-2.0, CubeRoot(-8.0));
  EXPECT_DOUBLE_EQ(3.0, FourthRoot(81.0));
  EXPECT_TRUE(std::isnan(SquareRoot(-1.0)));
  EXPECT_TRUE(std::isnan(FourthRoot(-16.0)));
}

TEST(Roots, ZeroRadicandIsZeroForAnyNonzeroDegree) {
  for (double n : {1.0, 2.0, 3.0, 0.5, -2.0, -3.0, 7.25}) {
    EXPECT_EQ(0.0, Root(0.0, n)) << "n=" << n;
    EXPECT_EQ(0.0, Root(-0.0, n)) << "n=" << n;
  }
}

TEST(Roots, ZeroDegreeIsNaN) {
  EXPECT_TRUE(std::isnan(Root(8.0, 0.0)));
  EXPECT_TRUE(std::isnan(Root(-8.0, 0.0)));
  EXPECT_TRUE(std::isnan(Root(0.0, 0.0)));
}

TEST(Roots, NaNPropagates) {
  EXPECT_TRUE(std::isnan(Root(kNaN, 3.0)));
  EXPECT_TRUE(std::isnan(Root(8.0, kNaN)));
  EXPECT_TRUE(std::isnan(Root(Root(-4.0, 2.0), 3.0)));
}

TEST(Roots, NonNegativeRadicandRoundTrips) {
  for (double x : {0.25, 1.0, 2.0, 10.0, 243.0, 1.0e6, 12345.678}) {
    for (int n = 1; n <= 9; ++n) {
      const double r = Root(x, static_cast<double>(n));
      EXPECT_NEAR(x, std::pow(r, n), x * 1e-12) << "x=" << x << " n=" << n;
    }
  }
}

TEST(Roots, NegativeRadicandOddDegreeIsRealAndNegative) {
  for (double x : {-0.125, -1.0, -8.0, -243.0, -1.0e9}) {
    for (int n : {1, 3, 5, 7, 9, -1, -3}) {
      const double r = Root(x, static_cast<double>(n));
      ASSERT_FALSE(std::isnan(r)) << "x=" << x << " n=" << n;
      EXPECT_LT(r, 0.0) << "x=" << x << " n=" << n;
      EXPECT_NEAR(x, std::pow(r, n), std::fabs(x) * 1e-12) << "x=" << x << " n=" << n;
    }
  }
}

TEST(Roots, NegativeRadicandEvenOrFractionalDegreeIsNaN) {
  for (double x : {-0.5, -1.0, -64.0, -1.0e4}) {
    for (double n : {2.0, 4.0, 6.0, -2.0, 0.5, 2.5, 3.3}) {
      EXPECT_TRUE(std::isnan(Root(x, n))) << "x=" << x << " n=" << n;
    }
  }
}

TEST(Roots, NegativeDegreesInvert) {
  EXPECT_DOUBLE_EQ(0.5, Root(4.0, -2.0));
  EXPECT_DOUBLE_EQ(-0.5, Root(-8.0, -3.0));
}

TEST(Roots, InfiniteRadicand) {
  EXPECT_EQ(kInf, Root(kInf, 2.0));
  EXPECT_EQ(-kInf, Root(-kInf, 3.0));
}

TEST(Roots, IntegerRadicands) {
  EXPECT_DOUBLE_EQ(3.0, Root(243, 5));
  EXPECT_DOUBLE_EQ(-3.0, Root(-243, 5));
  EXPECT_DOUBLE_EQ(-3.0, Root(std::int8_t{-27}, 3));
  EXPECT_TRUE(std::isnan(Root(-64, 2)));
  EXPECT_DOUBLE_EQ(4.0, Root(std::uint64_t{16}, 2));
  EXPECT_EQ(0.0, Root(0u, 3));
  EXPECT_TRUE(std::isnan(Root(9, 0)));
  EXPECT_TRUE(std::isnan(Root(9u, 0)));
}

TEST(Roots, WideUnsignedDegreesKeepSignAndParity) {
  constexpr std::uint64_t kOddWide = std::numeric_limits<std::uint64_t>::max();
  constexpr std::uint64_t kEvenWide = std::uint64_t{1} << 63;
  const double odd = Root(std::int64_t{-8}, kOddWide);
  EXPECT_LT(odd, 0.0);
  EXPECT_NEAR(-1.0, odd, 1e-12);
  EXPECT_TRUE(std::isnan(Root(std::int64_t{-8}, kEvenWide)));
  EXPECT_NEAR(1.0, Root(std::uint64_t{16}, kEvenWide), 1e-12);
}
