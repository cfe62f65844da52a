#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include "NormalQuantile.h"

using Catch::Approx;
using namespace ledger;

TEST_CASE("normalQuantile matches the standard critical values", "[NormalQuantile]")
{
  REQUIRE(normalQuantile(0.5) == 0.0);
  REQUIRE(normalQuantile(0.975) == Approx(1.959963984540054).margin(1e-8));
  REQUIRE(normalQuantile(0.025) == Approx(-1.959963984540054).margin(1e-8));
  REQUIRE(normalQuantile(0.995) == Approx(2.575829303548901).margin(1e-8));

  SECTION("tails are symmetric")
    {
      REQUIRE(normalQuantile(0.001) == Approx(-normalQuantile(0.999)).margin(1e-10));
      REQUIRE(normalQuantile(0.01) == Approx(-2.326347874040841).margin(1e-8));
    }
}

TEST_CASE("normalQuantile rejects probabilities outside (0, 1)", "[NormalQuantile]")
{
  REQUIRE_THROWS_AS(normalQuantile(0.0), std::domain_error);
  REQUIRE_THROWS_AS(normalQuantile(1.0), std::domain_error);
  REQUIRE_THROWS_AS(normalQuantile(-0.2), std::domain_error);
}

TEST_CASE("normalCriticalValue gives the two sided half width", "[NormalQuantile]")
{
  REQUIRE(normalCriticalValue(0.95) == Approx(1.959963984540054).margin(1e-8));
  REQUIRE(normalCriticalValue(0.90) == Approx(1.644853626951472).margin(1e-8));
  REQUIRE_THROWS_AS(normalCriticalValue(1.0), std::domain_error);
}
