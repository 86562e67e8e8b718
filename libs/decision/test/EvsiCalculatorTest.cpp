#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "EvsiCalculator.h"

using Catch::Approx;
using namespace abvalue;

namespace
{
  // K = 0.05 * 1,000,000 * 1 = 50,000
  BusinessInputs business()
  {
    return BusinessInputs{0.05, 1000000.0, 1.0};
  }

  // 20 days of 1,000 visitors split evenly: 10,000 per arm
  TestDesign design(double dailyTraffic = 1000.0, double days = 20.0)
  {
    TestDesign d;
    d.testDurationDays = days;
    d.dailyTraffic = dailyTraffic;
    d.variantFraction = 0.5;
    d.eligibilityFraction = 1.0;
    d.conversionLatencyDays = 0.0;
    d.decisionLatencyDays = 0.0;
    return d;
  }

  MonteCarloOptions seeded(std::size_t samples, std::uint64_t seed)
  {
    MonteCarloOptions options;
    options.numSamples = samples;
    options.seed = seed;
    return options;
  }
}

TEST_CASE("EVSI: Normal fast path closed form", "[EVSI][Normal]")
{
  const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeNormal(0.0, 0.05), design()};
  const EvsiResult r = computeEvsi(inputs);

  // SE^2 = 19 * 2 / 10000; sigma_pre = sigma^2 / sqrt(sigma^2 + SE^2)
  const double se2 = 19.0 * 2.0 / 10000.0;
  const double sigmaPre = 0.0025 / std::sqrt(0.0025 + se2);

  REQUIRE(r.method == EvsiMethod::NormalFastPath);
  REQUIRE(r.sampleSizes.control == 10000);
  REQUIRE(r.sampleSizes.variant == 10000);
  REQUIRE(r.liftStandardError == Approx(std::sqrt(se2)));
  REQUIRE(r.evsiDollars == Approx(50000.0 * sigmaPre * 0.3989422804014327).epsilon(1e-10));
  REQUIRE(r.evpiDollars == Approx(50000.0 * 0.05 * 0.3989422804014327).epsilon(1e-10));
  REQUIRE(r.fractionOfEvpi == Approx(sigmaPre / 0.05).epsilon(1e-10));
  REQUIRE(r.probabilityTestChangesDecision == Approx(0.5));
  REQUIRE(r.defaultDecision == Decision::Ship);
  REQUIRE_FALSE(r.monteCarloStandardError.has_value());
  REQUIRE(r.warnings.empty());
}

TEST_CASE("EVSI: never exceeds EVPI and converges to it", "[EVSI][Normal]")
{
  const auto prior = PriorDistribution::makeNormal(0.01, 0.03);

  double previous = 0.0;
  for (double traffic : {100.0, 1000.0, 10000.0, 100000.0})
    {
      const EvsiResult r = computeEvsi(EvsiInputs{business(), 0.0, prior, design(traffic)});
      REQUIRE(r.evsiDollars <= r.evpiDollars);
      REQUIRE(r.evsiDollars > previous);
      previous = r.evsiDollars;
    }

  // About 10^9 visitors per arm
  const EvsiResult huge = computeEvsi(EvsiInputs{business(), 0.0, prior, design(1.0e8, 20.0)});
  REQUIRE(huge.evsiDollars == Approx(huge.evpiDollars).epsilon(1e-3));
  REQUIRE(huge.fractionOfEvpi > 0.999);
}

TEST_CASE("EVSI: Monte Carlo agrees with the closed form for Normal priors", "[EVSI][MonteCarlo]")
{
  const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeNormal(0.0, 0.05), design()};

  const EvsiResult closed = EvsiCalculator::normalFastPath(inputs);
  const EvsiResult simulated = EvsiCalculator::monteCarlo(inputs, seeded(400000, 12345u));

  REQUIRE(simulated.method == EvsiMethod::MonteCarlo);
  REQUIRE(simulated.numSamples == 400000);
  REQUIRE(simulated.numRejected == 0);
  REQUIRE(simulated.monteCarloStandardError.has_value());
  REQUIRE(*simulated.monteCarloStandardError > 0.0);
  REQUIRE(simulated.evsiDollars == Approx(closed.evsiDollars).epsilon(0.02));
  REQUIRE(simulated.probabilityTestChangesDecision == Approx(0.5).margin(0.01));

  SECTION("Non-zero threshold")
  {
    const EvsiInputs shifted{business(), 0.02, PriorDistribution::makeNormal(0.0, 0.05), design()};
    const EvsiResult c = EvsiCalculator::normalFastPath(shifted);
    const EvsiResult s = EvsiCalculator::monteCarlo(shifted, seeded(400000, 99u));
    REQUIRE(c.defaultDecision == Decision::DontShip);
    REQUIRE(s.evsiDollars == Approx(c.evsiDollars).epsilon(0.02));
    REQUIRE(s.probabilityTestChangesDecision == Approx(c.probabilityTestChangesDecision).margin(0.01));
  }
}

TEST_CASE("EVSI: seeded runs are reproducible", "[EVSI][MonteCarlo]")
{
  const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeStudentT(0.0, 0.04, 5.0), design()};

  const EvsiResult a = computeEvsi(inputs, seeded(2000, 7u));
  const EvsiResult b = computeEvsi(inputs, seeded(2000, 7u));
  REQUIRE(a.evsiDollars == b.evsiDollars);
  REQUIRE(a.probabilityTestChangesDecision == b.probabilityTestChangesDecision);
}

TEST_CASE("EVSI: Student-t and Uniform priors use Monte Carlo", "[EVSI][MonteCarlo]")
{
  SECTION("Student-t")
  {
    const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeStudentT(0.0, 0.04, 5.0), design()};
    const EvsiResult r = computeEvsi(inputs, seeded(20000, 11u));

    REQUIRE(r.method == EvsiMethod::MonteCarlo);
    REQUIRE(r.evsiDollars > 0.0);
    REQUIRE(r.evsiDollars <= r.evpiDollars * 1.05);
    REQUIRE(r.numSamples == 20000);
  }

  SECTION("Uniform")
  {
    const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeUniform(-0.1, 0.1), design()};
    const EvsiResult r = computeEvsi(inputs, seeded(20000, 13u));

    REQUIRE(r.method == EvsiMethod::MonteCarlo);
    REQUIRE(r.evpiDollars == Approx(0.025 * 50000.0).epsilon(1e-8));
    REQUIRE(r.evsiDollars > 0.0);
    REQUIRE(r.evsiDollars <= r.evpiDollars * 1.05);
    REQUIRE(r.probabilityClearsThreshold == Approx(0.5).margin(1e-12));
  }

  SECTION("Default sample count")
  {
    const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeUniform(-0.1, 0.1), design()};
    MonteCarloOptions options;
    options.seed = 3u;
    REQUIRE(computeEvsi(inputs, options).numSamples == DEFAULT_MONTE_CARLO_SAMPLES);
  }
}

TEST_CASE("EVSI: Student-t threshold far in the tail", "[EVSI][MonteCarlo][StudentT]")
{
  // K = 500,000; 15,000,000 visitors per arm gives SE of about 0.0016
  const BusinessInputs wide{0.05, 10000000.0, 1.0};
  const auto prior = PriorDistribution::makeStudentT(0.0, 0.01, 3.0);

  // 0.05 sits inside location +/- 6 scales, 0.07 beyond it
  for (double threshold : {0.05, 0.07})
    {
      const EvsiInputs inputs{wide, threshold, prior, design(1.0e6, 30.0)};
      const EvsiResult r = computeEvsi(inputs, seeded(200000, 2024u));

      REQUIRE(r.defaultDecision == Decision::DontShip);
      REQUIRE(r.evpiDollars > 0.0);
      REQUIRE(r.probabilityTestChangesDecision > 0.0);
      REQUIRE(r.evsiDollars > 0.5 * r.evpiDollars);
    }
}

TEST_CASE("EVSI: warnings", "[EVSI][warnings]")
{
  SECTION("Few expected conversions per arm")
  {
    // 100 visitors per arm at 5% is 5 conversions
    const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeNormal(0.0, 0.05), design(100.0, 2.0)};
    const EvsiResult r = computeEvsi(inputs);
    REQUIRE(hasWarning(r.warnings, "rare_events"));
  }

  SECTION("Prior mass beyond the feasible range")
  {
    // CR0 = 0.9 caps the lift near 11%
    const EvsiInputs inputs{BusinessInputs{0.9, 100000.0, 1.0}, 0.0,
			    PriorDistribution::makeNormal(0.1, 0.1), design()};
    const EvsiResult r = EvsiCalculator::monteCarlo(inputs, seeded(5000, 5u));
    REQUIRE(r.numRejected > 0);
    REQUIRE(hasWarning(r.warnings, "high_rejection"));
    REQUIRE_FALSE(hasWarning(r.warnings, "rare_events"));
  }
}

TEST_CASE("EVSI: errors", "[EVSI][error]")
{
  const auto prior = PriorDistribution::makeNormal(0.0, 0.05);

  SECTION("Empty arms")
  {
    TestDesign tiny = design(1.0, 1.0);
    REQUIRE_THROWS_AS(computeEvsi(EvsiInputs{business(), 0.0, prior, tiny}), ValidationException);
  }

  SECTION("Zero samples")
  {
    REQUIRE_THROWS_AS(EvsiCalculator::monteCarlo(EvsiInputs{business(), 0.0, prior, design()}, seeded(0, 1u)),
		      ValidationException);
  }

  SECTION("Fast path only for Normal priors")
  {
    REQUIRE_THROWS_AS(EvsiCalculator::normalFastPath(
			EvsiInputs{business(), 0.0, PriorDistribution::makeUniform(-0.1, 0.1), design()}),
		      ValidationException);
  }

  SECTION("No feasible draws")
  {
    // CR0 = 0.99 caps the lift near 1%, the prior sits far above it
    const EvsiInputs inputs{BusinessInputs{0.99, 100000.0, 1.0}, 0.0,
			    PriorDistribution::makeUniform(0.5, 0.9), design()};
    REQUIRE_THROWS_AS(computeEvsi(inputs, seeded(100, 1u)), NumericalException);
  }
}

TEST_CASE("EVSI: truncation flag propagates", "[EVSI][truncation]")
{
  const EvsiInputs inputs{business(), 0.0, PriorDistribution::makeNormal(-0.9, 0.5), design()};
  REQUIRE(computeEvsi(inputs).truncationSignificant);
}
