// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __NET_VALUE_CALCULATOR_H
#define __NET_VALUE_CALCULATOR_H 1

#include <algorithm>
#include <cmath>
#include <boost/accumulators/statistics/mean.hpp>
#include "CostOfDelay.h"
#include "DecisionException.h"
#include "DecisionResults.h"
#include "EvsiCalculator.h"
#include "ExperimentInputs.h"
#include "PreposteriorSimulator.h"
#include "PriorDistribution.h"
#include "RngUtils.h"

namespace abvalue
{
  struct NetValueInputs
  {
    BusinessInputs business;
    double thresholdLift;
    PriorDistribution prior;
    TestDesign design;
    CostInputs costs;
  };

  /**
   * @brief Fractions of the one-year horizon spent in each window of the test timeline.
   */
  struct TimelineFractions
  {
    double test;        // test running, variant share exposed
    double latency;     // waiting for conversions and for the decision, nothing shipped
    double remaining;   // decision in effect

    static TimelineFractions fromDesign(const TestDesign& design)
    {
      TimelineFractions f;
      f.test = design.testDurationDays / DAYS_PER_YEAR;
      f.latency = design.latencyDays() / DAYS_PER_YEAR;
      f.remaining = std::max(0.0, 1.0 - f.test - f.latency);
      return f;
    }
  };

  /**
   * @class NetValueCalculator
   * @brief Dollar value of running the test once delay and direct costs are paid.
   *
   * One simulation over the test timeline. With a test, the variant share earns
   * K * (L - T) during the test, nothing is shipped through the latency
   * window, and the post-test decision holds for the rest of the year. Without
   * a test, the default decision holds all year.
   *
   *   net = avg(with test) - avg(without test) - fixed cost - labor cost
   *         - daily cost of delay * (test days + latency days)
   *
   * The net value is reported unclamped; a negative value means the test
   * costs more than it is expected to earn.
   */
  class NetValueCalculator
  {
  public:
    static NetValueResult compute(const NetValueInputs& inputs,
				  const MonteCarloOptions& options = MonteCarloOptions())
    {
      auto rng = rng_utils::make_monte_carlo_rng(options.seed);
      return compute(inputs, options.numSamples, rng);
    }

    template <typename Rng>
    static NetValueResult compute(const NetValueInputs& inputs, std::size_t numSamples, Rng& rng)
    {
      const SampleSizes n = validate(inputs);
      if (numSamples == 0)
	throw ValidationException("simulation.numSamples", "must be at least 1");

      const PreposteriorSimulator simulator(inputs.prior, inputs.thresholdLift,
					    inputs.business.baselineConversionRate, n);

      const double K = inputs.business.dollarsPerUnitLift();
      const double T = inputs.thresholdLift;
      const double f = inputs.design.variantFraction;
      const TimelineFractions window = TimelineFractions::fromDesign(inputs.design);
      const Decision defaultDecision = simulator.defaultDecision();

      MonteCarloAccumulator duringTest;
      MonteCarloAccumulator afterDecision;
      MonteCarloAccumulator withoutTest;
      MonteCarloAccumulator difference;
      std::size_t decisionChanges = 0;

      const SimulationCounts counts = simulator.run(rng, numSamples, [&](const PreposteriorDraw& draw) {
	const double annualValue = K * (draw.trueLift - T);

	const double testValue = f * annualValue * window.test;
	const double postValue = isShip(draw.postTestDecision) ? annualValue * window.remaining : 0.0;
	const double baseline = isShip(defaultDecision) ? annualValue : 0.0;

	duringTest(testValue);
	afterDecision(postValue);
	withoutTest(baseline);
	difference(testValue + postValue - baseline);

	if (draw.postTestDecision != defaultDecision)
	  ++decisionChanges;
      });

      NetValueResult result;
      result.defaultDecision = defaultDecision;
      result.sampleSizes = n;
      result.numSamples = counts.accepted;
      result.numRejected = counts.rejected;
      result.truncationSignificant = inputs.prior.truncationSignificant();
      result.warnings = simulator.warnings(counts);

      result.avgValueDuringTest = boost::accumulators::mean(duringTest);
      result.avgValueAfterDecision = boost::accumulators::mean(afterDecision);
      result.avgValueWithTest = result.avgValueDuringTest + result.avgValueAfterDecision;
      result.avgValueWithoutTest = boost::accumulators::mean(withoutTest);
      result.grossValueDollars = validation::requireFiniteResult(
	result.avgValueWithTest - result.avgValueWithoutTest, "simulated value of testing");
      result.monteCarloStandardError = monteCarloStandardError(difference);

      result.fixedCostDollars = inputs.costs.fixedTestCost;
      result.laborCostDollars = inputs.costs.laborCost();
      result.delayCostDollars = inputs.costs.dailyCostOfDelay * inputs.design.daysUntilDecision();
      result.totalCostDollars = result.fixedCostDollars + result.laborCostDollars + result.delayCostDollars;

      result.netValueDollars = validation::requireFiniteResult(
	result.grossValueDollars - result.totalCostDollars, "net value");
      result.verdict = result.netValueDollars > 0.0 ? TestVerdict::TestThis : TestVerdict::DontTest;
      result.probabilityTestChangesDecision =
	static_cast<double>(decisionChanges) / static_cast<double>(counts.accepted);

      result.costOfDelay = computeCostOfDelay(K, inputs.prior.mean(), T, inputs.design);
      return result;
    }

    static SampleSizes validate(const NetValueInputs& inputs)
    {
      inputs.business.validate();
      validation::requireFinite(inputs.thresholdLift, "threshold.value");
      inputs.costs.validate();
      return deriveSampleSizes(inputs.design);
    }
  };

  inline NetValueResult computeNetValue(const NetValueInputs& inputs,
					const MonteCarloOptions& options = MonteCarloOptions())
  {
    return NetValueCalculator::compute(inputs, options);
  }

} // namespace abvalue

#endif // __NET_VALUE_CALCULATOR_H
