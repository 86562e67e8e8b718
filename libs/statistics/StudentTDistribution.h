// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//
// Location/scale Student-t distribution backed by Boost.Math.

#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>
#include <boost/math/distributions/students_t.hpp>

namespace abvalue
{
  namespace stats
  {
    /**
     * @class StudentTDistribution
     * @brief Student-t with location mu, scale s and degrees of freedom nu.
     *
     * X = mu + s * T where T follows the standard Student-t with nu degrees of
     * freedom. All evaluation is delegated to boost::math::students_t on the
     * standardised variable.
     */
    class StudentTDistribution
    {
    public:
      StudentTDistribution(double location, double scale, double degreesOfFreedom)
        : mLocation(location),
          mScale(scale),
          mStandard(checkedDegreesOfFreedom(degreesOfFreedom))
      {
        if (!(scale > 0.0) || !std::isfinite(scale))
          throw std::domain_error("StudentTDistribution: scale must be positive and finite");

        if (!std::isfinite(location))
          throw std::domain_error("StudentTDistribution: location must be finite");
      }

      double location() const { return mLocation; }
      double scale() const { return mScale; }
      double degreesOfFreedom() const { return mStandard.degrees_of_freedom(); }

      double pdf(double x) const
      {
        return boost::math::pdf(mStandard, (x - mLocation) / mScale) / mScale;
      }

      double cdf(double x) const
      {
        const double t = (x - mLocation) / mScale;
        if (std::isinf(t))
          return t < 0.0 ? 0.0 : 1.0;

        return boost::math::cdf(mStandard, t);
      }

      /**
       * @brief Inverse CDF. p must lie in the open interval (0, 1).
       *
       * @throws std::domain_error for p outside (0, 1)
       */
      double quantile(double p) const
      {
        if (!(p > 0.0 && p < 1.0))
          throw std::domain_error("StudentTDistribution: quantile probability must be in (0, 1)");

        return mLocation + mScale * boost::math::quantile(mStandard, p);
      }

      /**
       * @brief Two-sided critical value t such that P(-t < T < t) = confidenceLevel.
       *
       * For nu = 5 and a 90% level this is about 2.015.
       */
      static double criticalValue(double confidenceLevel, double degreesOfFreedom)
      {
        if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
          throw std::domain_error("StudentTDistribution: confidence level must be in (0, 1)");

        boost::math::students_t_distribution<double> standard(checkedDegreesOfFreedom(degreesOfFreedom));
        return boost::math::quantile(standard, 1.0 - (1.0 - confidenceLevel) / 2.0);
      }

    private:
      static double checkedDegreesOfFreedom(double nu)
      {
        if (!(nu > 0.0) || !std::isfinite(nu))
          throw std::domain_error("StudentTDistribution: degrees of freedom must be positive and finite");

        return nu;
      }

      double mLocation;
      double mScale;
      boost::math::students_t_distribution<double> mStandard;
    };

  } // namespace stats
} // namespace abvalue
