#include <catch2/catch_test_macros.hpp>
#include "number.h"
#include "DecimalConstants.h"
#include <cmath>

using namespace mkc_updown;
typedef num::DefaultNumber DecimalType;

TEST_CASE("Decimal conversions", "[number]")
{
  SECTION("fromString keeps seven decimal places")
  {
    DecimalType price = num::fromString<DecimalType>("0.4012345");
    REQUIRE(num::toString(price) == "0.4012345");
    REQUIRE(std::fabs(num::to_double(price) - 0.4012345) < 1e-12);
  }

  SECTION("Counts")
  {
    REQUIRE(num::fromCount<DecimalType>(0) == DecimalConstants<DecimalType>::DecimalZero);
    REQUIRE(num::fromCount<DecimalType>(250) == num::fromString<DecimalType>("250"));
  }

  SECTION("Helpers accept double")
  {
    REQUIRE(num::fromString<double>("0.5") == 0.5);
    REQUIRE(num::abs(-2.5) == 2.5);
    REQUIRE(num::toString(1.5) == std::to_string(1.5));
  }
}

TEST_CASE("Decimal arithmetic helpers", "[number]")
{
  DecimalType gap = num::fromString<DecimalType>("-150.25");
  DecimalType threshold = num::fromString<DecimalType>("100");

  REQUIRE(num::abs(gap) == num::fromString<DecimalType>("150.25"));
  REQUIRE(num::abs(threshold) == threshold);
  REQUIRE(num::maxOf(gap, threshold) == threshold);
  REQUIRE(num::minOf(gap, threshold) == gap);
}

TEST_CASE("Backtest constants", "[DecimalConstants]")
{
  REQUIRE(DecimalConstants<DecimalType>::WinningPayout == num::fromString<DecimalType>("1"));
  REQUIRE(DecimalConstants<DecimalType>::LosingPayout == DecimalConstants<DecimalType>::DecimalZero);
  REQUIRE(DecimalConstants<DecimalType>::DefaultStartingCapital == num::fromString<DecimalType>("100"));
  REQUIRE(DecimalConstants<DecimalType>::DefaultSpreadBuffer == num::fromString<DecimalType>("0.005"));
  REQUIRE(DecimalConstants<DecimalType>::DefaultFeeRate == DecimalConstants<DecimalType>::DecimalZero);
  REQUIRE(DecimalConstants<DecimalType>::DecimalOneHundred == num::fromString<DecimalType>("100"));

  REQUIRE(DecimalConstants<double>::DefaultSpreadBuffer == 0.005);
}
