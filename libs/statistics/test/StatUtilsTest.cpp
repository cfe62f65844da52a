// StatUtilsTest.cpp
//
// Unit tests for the descriptive statistics in StatUtils.h: mean, population
// and sample dispersion, coefficient of variation, percent change and the
// z-score guard.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <cmath>

#include "StatUtils.h"
#include "TestUtils.h"
#include "number.h"

using namespace ledger;

TEST_CASE("StatUtils mean and dispersion", "[StatUtils]") {
    SECTION("Mean of money amounts is exact") {
        std::vector<DecimalType> amounts = {DecimalType("0.10"), DecimalType("0.20"), DecimalType("0.30")};
        REQUIRE(StatUtils<DecimalType>::computeSum(amounts) == DecimalType("0.60"));
        REQUIRE(StatUtils<DecimalType>::computeMean(amounts) == DecimalType("0.20"));
    }

    SECTION("Empty series is safe") {
        std::vector<DecimalType> empty;
        REQUIRE(StatUtils<DecimalType>::computeMean(empty) == DecimalType("0.0"));
        REQUIRE(StatUtils<DecimalType>::computeVariance(empty) == 0.0);
        REQUIRE(StatUtils<DecimalType>::computeStatistics(empty).standardDeviation == 0.0);
    }

    SECTION("Population versus sample variance") {
        std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
        REQUIRE(StatUtils<double>::computeVariance(values) == Catch::Approx(4.0));
        REQUIRE(StatUtils<double>::computeStdDev(values) == Catch::Approx(2.0));
        REQUIRE(StatUtils<double>::computeSampleVariance(values) == Catch::Approx(32.0 / 7.0));
    }

    SECTION("Sample variance needs two values") {
        std::vector<double> one = {42.0};
        REQUIRE(StatUtils<double>::computeSampleVariance(one) == 0.0);
    }
}

TEST_CASE("StatUtils coefficient of variation", "[StatUtils]") {
    SECTION("Flat series has zero variation") {
        std::vector<DecimalType> flat(6, DecimalType("1000"));
        REQUIRE(StatUtils<DecimalType>::coefficientOfVariation(flat) == 0.0);
    }

    SECTION("Fewer than two values gives zero") {
        std::vector<DecimalType> single = {DecimalType("10")};
        REQUIRE(StatUtils<DecimalType>::coefficientOfVariation(single) == 0.0);
    }

    SECTION("Zero mean gives one") {
        std::vector<double> symmetric = {-5.0, 5.0};
        REQUIRE(StatUtils<double>::coefficientOfVariation(symmetric) == 1.0);
    }

    SECTION("Population standard deviation over mean") {
        std::vector<double> values = {90.0, 110.0};
        REQUIRE(StatUtils<double>::coefficientOfVariation(values) == Catch::Approx(0.1));
    }
}

TEST_CASE("StatUtils percent change", "[StatUtils]") {
    SECTION("Ordinary change") {
        REQUIRE(StatUtils<DecimalType>::percentChange(DecimalType("100"), DecimalType("115")) == DecimalType("15"));
        REQUIRE(StatUtils<DecimalType>::percentChange(DecimalType("200"), DecimalType("150")) == DecimalType("-25"));
    }

    SECTION("Zero baseline") {
        REQUIRE(StatUtils<DecimalType>::percentChange(DecimalType("0"), DecimalType("50")) == DecimalType("100"));
        REQUIRE(StatUtils<DecimalType>::percentChange(DecimalType("0"), DecimalType("0")) == DecimalType("0"));
        REQUIRE(StatUtils<DecimalType>::percentChange(DecimalType("0"), DecimalType("-10")) == DecimalType("0"));
    }

    SECTION("Negative baseline uses its magnitude") {
        REQUIRE(percentChange(-100.0, -50.0) == Catch::Approx(50.0));
        REQUIRE(percentChange(-100.0, -150.0) == Catch::Approx(-50.0));
    }

    SECTION("Counts") {
        REQUIRE(countPercentChange(10, 12) == Catch::Approx(20.0));
        REQUIRE(countPercentChange(0, 3) == Catch::Approx(100.0));
    }
}

TEST_CASE("zScore guard", "[StatUtils]") {
    REQUIRE_FALSE(zScore(1200.0, 1000.0, 0.0).has_value());
    REQUIRE(*zScore(1201.0, 1000.0, 100.0) == Catch::Approx(2.01));
    REQUIRE(*zScore(1199.0, 1000.0, 100.0) == Catch::Approx(1.99));
    REQUIRE(*zScore(800.0, SeriesStatistics{1000.0, 100.0}) == Catch::Approx(-2.0));
    REQUIRE_FALSE(zScore(std::nan(""), 1000.0, 100.0).has_value());
}
