#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>
#include "StudentTDistribution.h"
#include "NormalDistribution.h"

using Catch::Approx;
using abvalue::stats::StudentTDistribution;
using abvalue::stats::NormalDistribution;

TEST_CASE("StudentTDistribution: critical values for credible intervals", "[StudentT]")
{
    // Two-sided 90% critical values t_{0.95, df}
    REQUIRE(StudentTDistribution::criticalValue(0.90, 3.0) == Approx(2.353363434801823).margin(1e-9));
    REQUIRE(StudentTDistribution::criticalValue(0.90, 5.0) == Approx(2.015048372669157).margin(1e-9));
    REQUIRE(StudentTDistribution::criticalValue(0.90, 10.0) == Approx(1.812461122811676).margin(1e-9));

    SECTION("Approaches the normal critical value for large df")
    {
        REQUIRE(StudentTDistribution::criticalValue(0.90, 1e6) ==
                Approx(NormalDistribution::criticalValue(0.90)).margin(1e-5));
    }
}

TEST_CASE("StudentTDistribution: location and scale", "[StudentT]")
{
    StudentTDistribution t(0.02, 0.01, 5.0);

    REQUIRE(t.location() == 0.02);
    REQUIRE(t.scale() == 0.01);
    REQUIRE(t.degreesOfFreedom() == 5.0);

    SECTION("Symmetric about the location")
    {
        REQUIRE(t.cdf(0.02) == Approx(0.5).margin(1e-14));
        REQUIRE(t.cdf(0.03) + t.cdf(0.01) == Approx(1.0).margin(1e-12));
        REQUIRE(t.pdf(0.025) == Approx(t.pdf(0.015)).margin(1e-9));
    }

    SECTION("Quantile inverts the CDF")
    {
        for (double p : {0.01, 0.25, 0.5, 0.8, 0.999})
            REQUIRE(t.cdf(t.quantile(p)) == Approx(p).margin(1e-10));
    }

    SECTION("Density is scaled by 1/scale")
    {
        StudentTDistribution standard(0.0, 1.0, 5.0);
        REQUIRE(t.pdf(0.02) == Approx(standard.pdf(0.0) / 0.01).epsilon(1e-12));
    }

    SECTION("Infinite arguments")
    {
        REQUIRE(t.cdf(-std::numeric_limits<double>::infinity()) == 0.0);
        REQUIRE(t.cdf(std::numeric_limits<double>::infinity()) == 1.0);
    }
}

TEST_CASE("StudentTDistribution: invalid parameters", "[StudentT][error]")
{
    REQUIRE_THROWS_AS(StudentTDistribution(0.0, 0.0, 5.0), std::domain_error);
    REQUIRE_THROWS_AS(StudentTDistribution(0.0, -1.0, 5.0), std::domain_error);
    REQUIRE_THROWS_AS(StudentTDistribution(0.0, 1.0, 0.0), std::domain_error);

    StudentTDistribution t(0.0, 1.0, 3.0);
    REQUIRE_THROWS_AS(t.quantile(0.0), std::domain_error);
    REQUIRE_THROWS_AS(t.quantile(1.0), std::domain_error);
    REQUIRE_THROWS_AS(StudentTDistribution::criticalValue(1.0, 3.0), std::domain_error);
}
