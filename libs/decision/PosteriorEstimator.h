// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __POSTERIOR_ESTIMATOR_H
#define __POSTERIOR_ESTIMATOR_H 1

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <vector>
#include "DecisionException.h"
#include "ExperimentInputs.h"
#include "NormalDistribution.h"
#include "PriorDistribution.h"

namespace abvalue
{
  /**
   * @class PosteriorEstimator
   * @brief Posterior mean E[L | L_hat] for a test that reports L_hat ~ N(L, SE^2).
   *
   * - Normal prior: conjugate shrinkage, w = sigma^2 / (sigma^2 + SE^2).
   * - Uniform prior: the posterior is N(L_hat, SE^2) truncated to the prior
   *   support intersected with the feasible lift range, whose mean is exact.
   * - Student-t prior: log-space weights on a fixed grid over
   *   [max(-1, mu - 6s), min(mu + 6s, 1/CR0 - 1)]. When a decision threshold
   *   is given the grid is widened to T +/- 6 SE so the posterior mean can
   *   cross it.
   *
   * The prior terms that do not depend on L_hat are computed once at
   * construction, so one estimator serves a whole simulation.
   */
  class PosteriorEstimator
  {
  public:
    static constexpr std::size_t GRID_CELLS = 200;
    static constexpr double GRID_HALF_WIDTH_IN_SCALES = 6.0;

    PosteriorEstimator(const PriorDistribution& prior,
		       double liftStandardError,
		       const LiftBounds& bounds,
		       std::optional<double> decisionThreshold = std::nullopt)
      : mPrior(prior),
	mStandardError(liftStandardError),
	mBounds(bounds),
	mDecisionThreshold(decisionThreshold),
	mShrinkageWeight(0.0)
    {
      if (!(liftStandardError > 0.0) || !std::isfinite(liftStandardError))
	throw NumericalException("posterior estimation needs a positive, finite standard error");

      switch (prior.shape())
	{
	case PriorShape::Normal:
	  {
	    const double priorVariance = prior.normal().stdDev * prior.normal().stdDev;
	    mShrinkageWeight = priorVariance / (priorVariance + liftStandardError * liftStandardError);
	    break;
	  }
	case PriorShape::StudentT:
	  buildGrid();
	  break;
	case PriorShape::Uniform:
	  break;
	}
    }

    /**
     * @brief Weight given to the observed lift under a Normal prior.
     */
    double shrinkageWeight() const
    {
      return mShrinkageWeight;
    }

    double posteriorMean(double observedLift) const
    {
      if (!std::isfinite(observedLift))
	throw NumericalException("simulated lift estimate is not finite");

      switch (mPrior.shape())
	{
	case PriorShape::Normal:
	  return mShrinkageWeight * observedLift + (1.0 - mShrinkageWeight) * mPrior.normal().mean;

	case PriorShape::Uniform:
	  {
	    const double a = std::max(mBounds.lower, mPrior.uniform().lower);
	    const double b = std::min(mPrior.uniform().upper, mBounds.upper);
	    return truncatedNormalMean(observedLift, mStandardError, a, b);
	  }

	case PriorShape::StudentT:
	  return gridPosteriorMean(observedLift);
	}

      return mPrior.mean();
    }

    /**
     * @brief Mean of N(mu, sigma^2) truncated to [a, b].
     *
     * E = mu + sigma * (phi(alpha) - phi(beta)) / (Phi(beta) - Phi(alpha)).
     * When the interval holds almost none of the mass the mean collapses to
     * the nearest bound.
     */
    static double truncatedNormalMean(double mu, double sigma, double a, double b)
    {
      if (!(b > a) || !(sigma > 0.0))
	return std::clamp(mu, a, std::max(a, b));

      const double alpha = (a - mu) / sigma;
      const double beta = (b - mu) / sigma;

      // Evaluate the normaliser on whichever tail keeps precision.
      const double Z = alpha > 0.0
	? stats::NormalDistribution::standardNormalSurvival(alpha) - stats::NormalDistribution::standardNormalSurvival(beta)
	: stats::NormalDistribution::standardNormalCdf(beta) - stats::NormalDistribution::standardNormalCdf(alpha);

      if (Z < MIN_NORMALISER)
	return std::clamp(mu, a, b);

      const double phiAlpha = stats::NormalDistribution::standardNormalPdf(alpha);
      const double phiBeta = stats::NormalDistribution::standardNormalPdf(beta);
      return std::clamp(mu + sigma * (phiAlpha - phiBeta) / Z, a, b);
    }

  private:
    static constexpr double MIN_NORMALISER = 1e-10;

    void buildGrid()
    {
      const StudentTPrior& t = mPrior.studentT();
      mGridLow = std::max(LIFT_LOWER_BOUND, t.location - GRID_HALF_WIDTH_IN_SCALES * t.scale);
      mGridHigh = std::min(t.location + GRID_HALF_WIDTH_IN_SCALES * t.scale, mBounds.upper);

      if (mDecisionThreshold && std::isfinite(*mDecisionThreshold))
	{
	  const double reach = GRID_HALF_WIDTH_IN_SCALES * mStandardError;
	  mGridLow = std::max(LIFT_LOWER_BOUND, std::min(mGridLow, *mDecisionThreshold - reach));
	  mGridHigh = std::min(std::max(mGridHigh, *mDecisionThreshold + reach), mBounds.upper);
	}

      if (!(mGridHigh > mGridLow))
	return;

      const double step = (mGridHigh - mGridLow) / static_cast<double>(GRID_CELLS);
      mGridPoints.reserve(GRID_CELLS + 1);
      mLogPrior.reserve(GRID_CELLS + 1);
      for (std::size_t i = 0; i <= GRID_CELLS; ++i)
	{
	  const double x = mGridLow + static_cast<double>(i) * step;
	  const double density = mPrior.pdf(x);
	  mGridPoints.push_back(x);
	  mLogPrior.push_back(density > 0.0 ? std::log(density) : -std::numeric_limits<double>::infinity());
	}
    }

    double gridPosteriorMean(double observedLift) const
    {
      // Prior support and feasible range do not overlap on the grid.
      if (mGridPoints.empty())
	return std::clamp(mPrior.mean(), mBounds.lower, mBounds.upper);

      const double inverseVariance = 1.0 / (mStandardError * mStandardError);
      double maxLogWeight = -std::numeric_limits<double>::infinity();

      std::vector<double> logWeights(mGridPoints.size());
      for (std::size_t i = 0; i < mGridPoints.size(); ++i)
	{
	  const double d = observedLift - mGridPoints[i];
	  // Gaussian normalising constants cancel in the ratio.
	  logWeights[i] = mLogPrior[i] - 0.5 * d * d * inverseVariance;
	  maxLogWeight = std::max(maxLogWeight, logWeights[i]);
	}

      if (!std::isfinite(maxLogWeight))
	return std::clamp(observedLift, mGridLow, mGridHigh);

      double weightedSum = 0.0;
      double totalWeight = 0.0;
      for (std::size_t i = 0; i < mGridPoints.size(); ++i)
	{
	  const double w = std::exp(logWeights[i] - maxLogWeight);
	  weightedSum += mGridPoints[i] * w;
	  totalWeight += w;
	}

      return weightedSum / totalWeight;
    }

    PriorDistribution mPrior;
    double mStandardError;
    LiftBounds mBounds;
    std::optional<double> mDecisionThreshold;
    double mShrinkageWeight;
    double mGridLow = 0.0;
    double mGridHigh = 0.0;
    std::vector<double> mGridPoints;
    std::vector<double> mLogPrior;
  };

} // namespace abvalue

#endif // __POSTERIOR_ESTIMATOR_H
