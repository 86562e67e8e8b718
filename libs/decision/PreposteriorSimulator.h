// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __PREPOSTERIOR_SIMULATOR_H
#define __PREPOSTERIOR_SIMULATOR_H 1

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include "DecisionException.h"
#include "DecisionResults.h"
#include "DecisionRule.h"
#include "ExperimentInputs.h"
#include "PosteriorEstimator.h"
#include "PriorDistribution.h"
#include "RngUtils.h"

namespace abvalue
{
  constexpr std::size_t DEFAULT_MONTE_CARLO_SAMPLES = 5000;

  // Expected conversions per arm below which the normal approximation is doubtful.
  constexpr double RARE_EVENT_CONVERSIONS = 20.0;

  // Share of prior draws outside the feasible range that triggers a warning.
  constexpr double HIGH_REJECTION_RATE = 0.10;

  using MonteCarloAccumulator = boost::accumulators::accumulator_set<
    double,
    boost::accumulators::stats<
      boost::accumulators::tag::mean,
      boost::accumulators::tag::variance,
      boost::accumulators::tag::count
      >
    >;

  /**
   * @brief Standard error of the mean held in a Monte Carlo accumulator.
   *
   * Boost reports the population variance, so the sample variance is
   * recovered with the n / (n - 1) correction.
   */
  inline double monteCarloStandardError(const MonteCarloAccumulator& acc)
  {
    const std::size_t n = boost::accumulators::count(acc);
    if (n < 2)
      return 0.0;

    const double populationVariance = boost::accumulators::variance(acc);
    return std::sqrt(std::max(0.0, populationVariance) / static_cast<double>(n - 1));
  }

  /**
   * @brief One simulated world: a true lift, what the test showed, and what we decided.
   */
  struct PreposteriorDraw
  {
    double trueLift;
    double observedLift;
    double posteriorMean;
    Decision postTestDecision;
  };

  struct SimulationCounts
  {
    std::size_t accepted = 0;
    std::size_t rejected = 0;

    double rejectionRate() const
    {
      const std::size_t attempts = accepted + rejected;
      return attempts == 0 ? 0.0 : static_cast<double>(rejected) / static_cast<double>(attempts);
    }
  };

  /**
   * @class PreposteriorSimulator
   * @brief Shared Monte Carlo engine behind the EVSI and net value calculators.
   *
   * Each iteration draws a true lift from the prior, rejecting draws outside
   * the feasible range [-1, 1/CR0 - 1], simulates the test estimate
   * L_hat = L + SE * Z and applies the decision rule to the posterior mean.
   * The caller's visitor turns each draw into dollars.
   */
  class PreposteriorSimulator
  {
  public:
    static constexpr std::size_t MAX_ATTEMPTS_PER_SAMPLE = 10;

    PreposteriorSimulator(const PriorDistribution& prior,
			  double threshold,
			  double baselineConversionRate,
			  const SampleSizes& sampleSizes)
      : mPrior(prior),
	mThreshold(threshold),
	mBaselineConversionRate(baselineConversionRate),
	mSampleSizes(sampleSizes),
	mBounds(liftFeasibilityBounds(baselineConversionRate)),
	mStandardError(liftStandardError(baselineConversionRate, sampleSizes)),
	mEstimator(prior, mStandardError, mBounds, threshold),
	mDefaultDecision(decide(prior.mean(), threshold))
    {}

    double standardError() const
    {
      return mStandardError;
    }

    const LiftBounds& bounds() const
    {
      return mBounds;
    }

    Decision defaultDecision() const
    {
      return mDefaultDecision;
    }

    const PosteriorEstimator& estimator() const
    {
      return mEstimator;
    }

    /**
     * @brief Run the simulation, calling visit(const PreposteriorDraw&) per accepted draw.
     *
     * Stops after numSamples accepted draws or MAX_ATTEMPTS_PER_SAMPLE * numSamples
     * attempts, whichever comes first.
     *
     * @throws ValidationException if numSamples is zero
     * @throws NumericalException if no draw falls inside the feasible range
     */
    template <typename Rng, typename Visitor>
    SimulationCounts run(Rng& rng, std::size_t numSamples, Visitor&& visit) const
    {
      if (numSamples == 0)
	throw ValidationException("simulation.numSamples", "must be at least 1");

      SimulationCounts counts;
      const std::size_t maxAttempts = numSamples * MAX_ATTEMPTS_PER_SAMPLE;

      for (std::size_t attempt = 0; attempt < maxAttempts && counts.accepted < numSamples; ++attempt)
	{
	  const double trueLift = mPrior.sample(rng);
	  if (!mBounds.contains(trueLift))
	    {
	      ++counts.rejected;
	      continue;
	    }

	  ++counts.accepted;

	  PreposteriorDraw draw;
	  draw.trueLift = trueLift;
	  draw.observedLift = trueLift + mStandardError * rng_utils::get_standard_normal(rng);
	  draw.posteriorMean = mEstimator.posteriorMean(draw.observedLift);
	  draw.postTestDecision = decide(draw.posteriorMean, mThreshold);
	  visit(draw);
	}

      if (counts.accepted == 0)
	throw NumericalException("every prior draw fell outside the feasible lift range [-1, " +
				 std::to_string(mBounds.upper) + "]");

      return counts;
    }

    /**
     * @brief P(L >= T) for the prior restricted to the feasible range.
     *
     * This is the distribution the simulation actually samples.
     */
    double feasibleProbabilityClearsThreshold() const
    {
      const double low = mPrior.cdf(mBounds.lower);
      const double high = mPrior.cdf(mBounds.upper);
      const double mass = high - low;
      if (!(mass > 0.0))
	throw NumericalException("prior " + mPrior.describe() + " has no mass in the feasible lift range");

      const double atThreshold = mPrior.cdf(std::clamp(mThreshold, mBounds.lower, mBounds.upper));
      return std::clamp((high - atThreshold) / mass, 0.0, 1.0);
    }

    /**
     * @brief Caveats for the test design and the completed simulation.
     */
    std::vector<CalculationWarning> warnings(const SimulationCounts& counts) const
    {
      std::vector<CalculationWarning> result = designWarnings();

      const double rate = counts.rejectionRate();
      if (rate > HIGH_REJECTION_RATE)
	{
	  std::ostringstream msg;
	  msg << "High rejection rate (" << std::lround(rate * 100.0)
	      << "%) due to prior mass outside feasible conversion bounds. "
	      << "Consider narrowing the prior or adjusting the baseline rate.";
	  result.push_back(CalculationWarning{"high_rejection", msg.str()});
	}

      return result;
    }

    /**
     * @brief Warnings that depend only on the design, shared with the closed-form path.
     */
    std::vector<CalculationWarning> designWarnings() const
    {
      std::vector<CalculationWarning> result;

      const double minArm = static_cast<double>(std::min(mSampleSizes.control, mSampleSizes.variant));
      if (minArm * mBaselineConversionRate < RARE_EVENT_CONVERSIONS)
	result.push_back(CalculationWarning{
	    "rare_events",
	    "Expected conversions per group are low (<20). The normal approximation for lift "
	    "may be less accurate. Consider increasing test duration or traffic."});

      return result;
    }

  private:
    PriorDistribution mPrior;
    double mThreshold;
    double mBaselineConversionRate;
    SampleSizes mSampleSizes;
    LiftBounds mBounds;
    double mStandardError;
    PosteriorEstimator mEstimator;
    Decision mDefaultDecision;
  };

} // namespace abvalue

#endif // __PREPOSTERIOR_SIMULATOR_H
