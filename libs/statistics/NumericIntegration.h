#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>
#include <boost/math/quadrature/gauss_kronrod.hpp>

namespace abvalue
{
  namespace stats
  {
    /**
     * @brief Value and estimated absolute error of a one-dimensional integral.
     */
    struct IntegrationResult
    {
      double value;
      double errorEstimate;
    };

    /**
     * @brief Adaptive 61-point Gauss-Kronrod quadrature of f over [a, b].
     *
     * Either bound may be infinite; Boost maps infinite ranges onto a finite
     * interval internally. Reversed bounds return the negated integral and
     * an empty interval returns zero.
     *
     * @param f         Callable double(double)
     * @param a         Lower bound
     * @param b         Upper bound
     * @param tolerance Relative error target
     * @param maxDepth  Maximum bisection depth
     *
     * @throws std::invalid_argument if either bound is NaN
     * @throws std::runtime_error if the integral does not evaluate to a finite number
     */
    template <typename Func>
    inline IntegrationResult integrateAdaptive(Func f,
                                               double a,
                                               double b,
                                               double tolerance = 1e-10,
                                               unsigned maxDepth = 15)
    {
      if (std::isnan(a) || std::isnan(b))
        throw std::invalid_argument("integrateAdaptive: bounds must not be NaN");

      if (a == b)
        return IntegrationResult{0.0, 0.0};

      double error = 0.0;
      double l1 = 0.0;
      const double value = boost::math::quadrature::gauss_kronrod<double, 61>::integrate(
        f, a, b, maxDepth, tolerance, &error, &l1);

      if (!std::isfinite(value))
        throw std::runtime_error("integrateAdaptive: integral did not converge to a finite value");

      return IntegrationResult{value, error};
    }

  } // namespace stats
} // namespace abvalue
