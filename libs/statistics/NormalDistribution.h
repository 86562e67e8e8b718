// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//
// Normal Distribution Utility Functions
// Standard normal pdf, CDF, quantile and the unit normal loss integral,
// plus a location/scale wrapper used by the prior models.

#pragma once

#include <cmath>
#include <limits>
#include "NormalQuantile.h"

namespace abvalue
{
  namespace stats
  {
    /**
     * @struct NormalDistribution
     * @brief Static helpers for the standard normal distribution N(0,1).
     *
     * inverseNormalCdf is noexcept and maps the closed boundaries to
     * -infinity / +infinity instead of throwing, so it can be used inside
     * sampling loops. Callers that need a hard failure should call
     * detail::compute_normal_quantile directly.
     */
    struct NormalDistribution
    {
      static double standardNormalPdf(double x) noexcept
      {
        return detail::compute_normal_pdf(x);
      }

      static double standardNormalCdf(double x) noexcept
      {
        return detail::compute_normal_cdf(x);
      }

      static double standardNormalSurvival(double x) noexcept
      {
        return detail::compute_normal_survival(x);
      }

      /**
       * @brief Phi^-1(p). Returns -inf for p <= 0 and +inf for p >= 1.
       */
      static double inverseNormalCdf(double p) noexcept
      {
        if (!(p > 0.0))
          return -std::numeric_limits<double>::infinity();
        if (!(p < 1.0))
          return std::numeric_limits<double>::infinity();

        return detail::compute_normal_quantile(p);
      }

      /**
       * @brief Unit normal loss integral G(z) = E[max(0, Z - z)].
       */
      static double unitNormalLoss(double z) noexcept
      {
        return detail::compute_unit_normal_loss(z);
      }

      /**
       * @brief Two-sided critical value. Returns +inf when the level is not in (0, 1).
       */
      static double criticalValue(double confidenceLevel) noexcept
      {
        if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
          return std::numeric_limits<double>::infinity();

        return inverseNormalCdf(1.0 - (1.0 - confidenceLevel) / 2.0);
      }

      // Location/scale forms. sigma must be positive.

      static double pdf(double x, double mu, double sigma) noexcept
      {
        return standardNormalPdf((x - mu) / sigma) / sigma;
      }

      static double cdf(double x, double mu, double sigma) noexcept
      {
        return standardNormalCdf((x - mu) / sigma);
      }

      static double quantile(double p, double mu, double sigma) noexcept
      {
        return mu + sigma * inverseNormalCdf(p);
      }
    };

  } // namespace stats
} // namespace abvalue
