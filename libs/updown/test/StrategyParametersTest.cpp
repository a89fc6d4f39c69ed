#include "StrategyParameters.h"
#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"

using namespace mkc_updown;

TEST_CASE("StrategyParameters lookups", "[StrategyParameters]")
{
  StrategyParameters<DecimalType> parameters;
  REQUIRE(parameters.empty());
  REQUIRE(parameters.getNumParameters() == 0);

  parameters.setParameter("positionSize", createDecimal("10"));
  parameters.setParameter("deficitThreshold", createDecimal("80"));

  std::size_t count = parameters.getNumParameters();
  REQUIRE(count == 2);
  REQUIRE(parameters.hasParameter("positionSize"));
  REQUIRE(parameters.getParameter("deficitThreshold") == createDecimal("80"));
  REQUIRE(parameters.getParameter("maxDownPrice", createDecimal("0.65")) == createDecimal("0.65"));
  REQUIRE_THROWS_AS(parameters.getParameter("maxDownPrice"), StrategyParameterException);

  SECTION("Iteration is ordered by name")
  {
    auto it = parameters.beginParameters();
    REQUIRE(it->first == "deficitThreshold");
    ++it;
    REQUIRE(it->first == "positionSize");
    ++it;
    REQUIRE(it == parameters.endParameters());
  }

  SECTION("Merge keeps the right-hand value")
  {
    StrategyParameters<DecimalType> overrides;
    overrides.setParameter("positionSize", createDecimal("25"));

    StrategyParameters<DecimalType> merged = parameters.merge(overrides);
    REQUIRE(merged.getNumParameters() == 2);
    REQUIRE(merged.getParameter("positionSize") == createDecimal("25"));
    REQUIRE(merged != parameters);
  }
}
