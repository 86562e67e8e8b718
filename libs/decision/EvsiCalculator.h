// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __EVSI_CALCULATOR_H
#define __EVSI_CALCULATOR_H 1

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include "DecisionException.h"
#include "DecisionResults.h"
#include "EvpiCalculator.h"
#include "ExperimentInputs.h"
#include "NormalDistribution.h"
#include "PreposteriorSimulator.h"
#include "PriorDistribution.h"
#include "RngUtils.h"

namespace abvalue
{
  /**
   * @brief Monte Carlo settings. A seed makes runs reproducible; leave it
   *        empty in production.
   */
  struct MonteCarloOptions
  {
    std::size_t numSamples = DEFAULT_MONTE_CARLO_SAMPLES;
    std::optional<std::uint64_t> seed;
  };

  struct EvsiInputs
  {
    BusinessInputs business;
    double thresholdLift;
    PriorDistribution prior;
    TestDesign design;
  };

  /**
   * @class EvsiCalculator
   * @brief Expected Value of Sample Information for a proposed test design.
   *
   * The expected improvement from deciding on the posterior mean after the
   * test instead of on the prior mean now. Normal priors have an O(1) closed
   * form through the pre-posterior spread. Every shape can be simulated.
   */
  class EvsiCalculator
  {
  public:
    static bool usesFastPath(const EvsiInputs& inputs)
    {
      return inputs.prior.shape() == PriorShape::Normal;
    }

    /**
     * @brief Closed form for Normal priors, Monte Carlo otherwise.
     */
    static EvsiResult compute(const EvsiInputs& inputs, const MonteCarloOptions& options = MonteCarloOptions())
    {
      if (usesFastPath(inputs))
	return normalFastPath(inputs);

      return monteCarlo(inputs, options);
    }

    /**
     * @brief Pre-posterior closed form.
     *
     * sigma_pre = sigma * sqrt(sigma^2 / (sigma^2 + SE^2)) is the spread of the
     * posterior mean before the data arrive. EVSI is the unit normal loss
     * integral of the EVPI formula evaluated at sigma_pre.
     *
     * @throws ValidationException if the prior is not Normal
     */
    static EvsiResult normalFastPath(const EvsiInputs& inputs)
    {
      if (inputs.prior.shape() != PriorShape::Normal)
	throw ValidationException("prior.shape", "the closed-form EVSI path requires a normal prior");

      const SampleSizes n = validate(inputs);
      const PreposteriorSimulator simulator(inputs.prior, inputs.thresholdLift,
					    inputs.business.baselineConversionRate, n);

      const NormalPrior& prior = inputs.prior.normal();
      const double K = inputs.business.dollarsPerUnitLift();
      const double T = inputs.thresholdLift;
      const double se = simulator.standardError();

      const double priorVariance = prior.stdDev * prior.stdDev;
      const double sigmaPre = priorVariance / std::sqrt(priorVariance + se * se);
      validation::requireFiniteResult(sigmaPre, "pre-posterior standard deviation");

      EvsiResult result = baseResult(inputs, simulator, n);
      result.method = EvsiMethod::NormalFastPath;

      const double z = std::fabs(prior.mean - T) / sigmaPre;
      result.evsiDollars = validation::requireFiniteResult(
	K * sigmaPre * stats::NormalDistribution::unitNormalLoss(z), "EVSI");

      // The decision flips when the posterior mean crosses the threshold.
      const double PhiThreshold = stats::NormalDistribution::standardNormalCdf((T - prior.mean) / sigmaPre);
      result.probabilityTestChangesDecision = isShip(result.defaultDecision) ? PhiThreshold : 1.0 - PhiThreshold;

      result.warnings = simulator.designWarnings();
      finish(result);
      return result;
    }

    static EvsiResult monteCarlo(const EvsiInputs& inputs, const MonteCarloOptions& options = MonteCarloOptions())
    {
      auto rng = rng_utils::make_monte_carlo_rng(options.seed);
      return monteCarlo(inputs, options.numSamples, rng);
    }

    /**
     * @brief Simulated EVSI for any prior shape.
     *
     * For each feasible draw the improvement over the default decision is
     * K * (L - T) * (1[post-test ship] - 1[default ship]). EVSI is the mean
     * improvement, floored at zero, with its Monte Carlo standard error.
     */
    template <typename Rng>
    static EvsiResult monteCarlo(const EvsiInputs& inputs, std::size_t numSamples, Rng& rng)
    {
      const SampleSizes n = validate(inputs);
      if (numSamples == 0)
	throw ValidationException("simulation.numSamples", "must be at least 1");

      const PreposteriorSimulator simulator(inputs.prior, inputs.thresholdLift,
					    inputs.business.baselineConversionRate, n);

      const double K = inputs.business.dollarsPerUnitLift();
      const double T = inputs.thresholdLift;
      const Decision defaultDecision = simulator.defaultDecision();

      MonteCarloAccumulator improvement;
      std::size_t decisionChanges = 0;

      const SimulationCounts counts = simulator.run(rng, numSamples, [&](const PreposteriorDraw& draw) {
	const double valueIfShipped = K * (draw.trueLift - T);
	const double withTest = isShip(draw.postTestDecision) ? valueIfShipped : 0.0;
	const double withoutTest = isShip(defaultDecision) ? valueIfShipped : 0.0;
	improvement(withTest - withoutTest);

	if (draw.postTestDecision != defaultDecision)
	  ++decisionChanges;
      });

      EvsiResult result = baseResult(inputs, simulator, n);
      result.method = EvsiMethod::MonteCarlo;
      result.numSamples = counts.accepted;
      result.numRejected = counts.rejected;

      const double meanImprovement = validation::requireFiniteResult(
	boost::accumulators::mean(improvement), "simulated EVSI");
      result.evsiDollars = std::max(0.0, meanImprovement);
      result.monteCarloStandardError = monteCarloStandardError(improvement);
      result.probabilityTestChangesDecision =
	static_cast<double>(decisionChanges) / static_cast<double>(counts.accepted);

      result.warnings = simulator.warnings(counts);
      finish(result);
      return result;
    }

    /**
     * @brief Check every input and derive the arm sizes.
     *
     * @throws ValidationException naming the first offending field
     */
    static SampleSizes validate(const EvsiInputs& inputs)
    {
      inputs.business.validate();
      validation::requireFinite(inputs.thresholdLift, "threshold.value");
      return deriveSampleSizes(inputs.design);
    }

  private:
    static EvsiResult baseResult(const EvsiInputs& inputs,
				 const PreposteriorSimulator& simulator,
				 const SampleSizes& n)
    {
      EvsiResult result;
      result.defaultDecision = simulator.defaultDecision();
      result.sampleSizes = n;
      result.liftStandardError = simulator.standardError();
      result.truncationSignificant = inputs.prior.truncationSignificant();
      result.probabilityClearsThreshold = simulator.feasibleProbabilityClearsThreshold();
      result.evpiDollars = EvpiCalculator::compute(
	EvpiInputs{inputs.business, inputs.thresholdLift, inputs.prior}).evpiDollars;
      return result;
    }

    static void finish(EvsiResult& result)
    {
      result.fractionOfEvpi = result.evpiDollars > 0.0 ? result.evsiDollars / result.evpiDollars : 0.0;
    }
  };

  inline EvsiResult computeEvsi(const EvsiInputs& inputs, const MonteCarloOptions& options = MonteCarloOptions())
  {
    return EvsiCalculator::compute(inputs, options);
  }

} // namespace abvalue

#endif // __EVSI_CALCULATOR_H
