// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __EVPI_CALCULATOR_H
#define __EVPI_CALCULATOR_H 1

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include "DecisionException.h"
#include "DecisionResults.h"
#include "DecisionRule.h"
#include "ExperimentInputs.h"
#include "NormalDistribution.h"
#include "NumericIntegration.h"
#include "PriorDistribution.h"

namespace abvalue
{
  constexpr double NEAR_ZERO_SIGMA = 0.001;
  constexpr double ONE_SIDED_UPPER = 0.9999;
  constexpr double ONE_SIDED_LOWER = 0.0001;

  struct EvpiInputs
  {
    BusinessInputs business;
    double thresholdLift;
    PriorDistribution prior;
  };

  /**
   * @class EvpiCalculator
   * @brief Expected Value of Perfect Information.
   *
   * The most a decision-maker should pay to learn the true lift before
   * deciding. With default decision d chosen on the prior mean:
   *
   *   ship:       EVPI = K * E[max(0, T - L)]
   *   don't ship: EVPI = K * E[max(0, L - T)]
   *
   * Normal priors use the unit normal loss integral on the untruncated prior.
   * Student-t and Uniform priors integrate the truncated density numerically.
   */
  class EvpiCalculator
  {
  public:
    static EvpiResult compute(const EvpiInputs& inputs)
    {
      validate(inputs);

      const PriorDistribution& prior = inputs.prior;
      const double K = inputs.business.dollarsPerUnitLift();
      const double T = inputs.thresholdLift;

      EvpiResult result;
      result.K = K;
      result.thresholdLift = T;
      result.thresholdDollars = K * T;
      result.priorMean = prior.mean();
      result.defaultDecision = decide(prior.mean(), T);
      result.truncationSignificant = prior.truncationSignificant();

      const double loss = expectedOpportunityLoss(prior, T, result.defaultDecision);
      result.evpiDollars = validation::requireFiniteResult(K * loss, "EVPI");

      result.probabilityClearsThreshold = probabilityClearsThreshold(prior, T);
      result.chanceOfBeingWrong = isShip(result.defaultDecision)
	? 1.0 - result.probabilityClearsThreshold
	: result.probabilityClearsThreshold;

      if (prior.shape() == PriorShape::Normal)
	{
	  const NormalPrior& p = prior.normal();
	  const double z = (T - p.mean) / p.stdDev;
	  NormalDiagnostics diag{z,
				 stats::NormalDistribution::standardNormalPdf(z),
				 stats::NormalDistribution::standardNormalCdf(z)};
	  result.normalDiagnostics = diag;
	  result.edgeCases.nearZeroSigma = p.stdDev < NEAR_ZERO_SIGMA;
	  result.edgeCases.priorOneSided = diag.PhiZ > ONE_SIDED_UPPER || diag.PhiZ < ONE_SIDED_LOWER;
	}
      else
	{
	  const double pBelow = 1.0 - result.probabilityClearsThreshold;
	  result.edgeCases.nearZeroSigma = prior.spread() < NEAR_ZERO_SIGMA;
	  result.edgeCases.priorOneSided = pBelow > ONE_SIDED_UPPER || pBelow < ONE_SIDED_LOWER;
	}

      return result;
    }

    /**
     * @brief Expected loss per unit lift of committing to a decision without data.
     *
     * Closed form for Normal priors, numeric for the other shapes.
     */
    static double expectedOpportunityLoss(const PriorDistribution& prior,
					  double threshold,
					  Decision decision)
    {
      if (prior.shape() == PriorShape::Normal)
	return normalOpportunityLoss(prior.normal(), threshold, decision);

      return numericOpportunityLoss(prior, threshold, decision);
    }

    /**
     * @brief sigma * G(z) with z the signed distance from the mean to the
     *        threshold measured in the direction of the loss.
     */
    static double normalOpportunityLoss(const NormalPrior& prior, double threshold, Decision decision)
    {
      const double z = isShip(decision)
	? (prior.mean - threshold) / prior.stdDev
	: (threshold - prior.mean) / prior.stdDev;

      return prior.stdDev * stats::NormalDistribution::unitNormalLoss(z);
    }

    /**
     * @brief Adaptive quadrature of the loss over the prior truncated at L >= -1.
     *
     * Valid for every shape. Used directly for Student-t and Uniform priors and
     * as a cross-check of the Normal closed form.
     */
    static double numericOpportunityLoss(const PriorDistribution& prior,
					 double threshold,
					 Decision decision)
    {
      const double inf = std::numeric_limits<double>::infinity();

      double supportLow = LIFT_LOWER_BOUND;
      double supportHigh = inf;
      if (prior.shape() == PriorShape::Uniform)
	{
	  supportLow = std::max(supportLow, prior.uniform().lower);
	  supportHigh = prior.uniform().upper;
	}

      if (supportHigh <= supportLow)
	throw NumericalException("prior " + prior.describe() + " has no mass at or above a -100% lift");

      double value = 0.0;
      if (isShip(decision))
	{
	  // Loss when the true lift falls short of the threshold.
	  const double upper = std::min(threshold, supportHigh);
	  if (upper > supportLow)
	    value = integrateLoss([&](double x) { return (threshold - x) * prior.truncatedPdf(x); },
				  supportLow, upper);
	}
      else
	{
	  // Loss when the true lift exceeds the threshold.
	  const double lower = std::max(threshold, supportLow);
	  if (supportHigh > lower)
	    value = integrateUpperTail([&](double x) { return (x - threshold) * prior.truncatedPdf(x); },
				       prior, lower, supportHigh);
	}

      return validation::requireFiniteResult(std::max(0.0, value), "expected opportunity loss");
    }

    /**
     * @brief Quadrature of a loss integrand over [a, b].
     *
     * @throws NumericalException if the integral cannot be evaluated
     */
    template <typename Func>
    static double integrateLoss(Func f, double a, double b)
    {
      try
	{
	  return stats::integrateAdaptive(f, a, b).value;
	}
      catch (const NumericalException&)
	{
	  throw;
	}
      catch (const std::exception& e)
	{
	  throw NumericalException(std::string("expected opportunity loss: ") + e.what());
	}
    }

    /**
     * @brief P(L >= T) under the truncated prior.
     */
    static double probabilityClearsThreshold(const PriorDistribution& prior, double threshold)
    {
      return std::clamp(1.0 - prior.truncatedCdf(threshold), 0.0, 1.0);
    }

  private:
    static void validate(const EvpiInputs& inputs)
    {
      inputs.business.validate();
      validation::requireFinite(inputs.thresholdLift, "threshold.value");
    }

    // Split heavy-tailed integrals at the bulk of the prior so the infinite
    // piece only sees the tail.
    template <typename Func>
    static double integrateUpperTail(Func f, const PriorDistribution& prior, double lower, double upper)
    {
      if (std::isfinite(upper))
	return integrateLoss(f, lower, upper);

      const double split = std::max(lower, prior.mean() + 10.0 * prior.spread());
      double value = 0.0;
      if (split > lower)
	value += integrateLoss(f, lower, split);
      value += integrateLoss(f, split, upper);
      return value;
    }
  };

  inline EvpiResult computeEvpi(const EvpiInputs& inputs)
  {
    return EvpiCalculator::compute(inputs);
  }

} // namespace abvalue

#endif // __EVPI_CALCULATOR_H
