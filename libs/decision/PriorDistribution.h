// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __PRIOR_DISTRIBUTION_H
#define __PRIOR_DISTRIBUTION_H 1

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <variant>
#include "DecisionException.h"
#include "NormalDistribution.h"
#include "StudentTDistribution.h"
#include "RngUtils.h"

namespace abvalue
{
  // A lift below -100% would mean a negative conversion rate.
  constexpr double LIFT_LOWER_BOUND = -1.0;

  // Untruncated mass below LIFT_LOWER_BOUND above which results are flagged.
  constexpr double TRUNCATION_SIGNIFICANCE_THRESHOLD = 0.001;

  // Credible intervals entered by the user hold the central 90% of belief.
  constexpr double CREDIBLE_INTERVAL_LEVEL = 0.90;

  constexpr double DEFAULT_PRIOR_MEAN = 0.0;
  constexpr double DEFAULT_PRIOR_STD_DEV = 0.05;
  constexpr double DEFAULT_STUDENT_T_DF = 5.0;

  enum class PriorShape
  {
    Normal,
    StudentT,
    Uniform
  };

  inline std::string priorShapeToString(PriorShape shape)
  {
    switch (shape)
      {
      case PriorShape::Normal:
	return "normal";
      case PriorShape::StudentT:
	return "student-t";
      case PriorShape::Uniform:
	return "uniform";
      }
    return "unknown";
  }

  inline PriorShape priorShapeFromString(const std::string& name)
  {
    if (name == "normal")
      return PriorShape::Normal;
    if (name == "student-t" || name == "studentT" || name == "student_t")
      return PriorShape::StudentT;
    if (name == "uniform")
      return PriorShape::Uniform;

    throw ValidationException("prior.shape", "unknown prior shape '" + name + "'");
  }

  struct NormalPrior
  {
    double mean;
    double stdDev;
  };

  struct StudentTPrior
  {
    double location;
    double scale;
    double degreesOfFreedom;
  };

  struct UniformPrior
  {
    double lower;
    double upper;
  };

  /**
   * @class PriorDistribution
   * @brief Belief about the true relative lift of a change.
   *
   * A closed set of three shapes behind one interface. Parameters are fixed at
   * construction. Every shape exposes its untruncated pdf/cdf/quantile and the
   * variants truncated to L >= -1 and renormalised by 1 / (1 - CDF(-1)).
   *
   * Calculators branch once on shape() and read the matching parameter struct
   * through normal(), studentT() or uniform().
   */
  class PriorDistribution
  {
  public:
    using Parameters = std::variant<NormalPrior, StudentTPrior, UniformPrior>;

    static PriorDistribution makeNormal(double mean, double stdDev)
    {
      validation::requireFinite(mean, "prior.mean");
      validation::requirePositive(stdDev, "prior.stdDev");
      return PriorDistribution(NormalPrior{mean, stdDev});
    }

    static PriorDistribution makeStudentT(double location, double scale, double degreesOfFreedom)
    {
      validation::requireFinite(location, "prior.location");
      validation::requirePositive(scale, "prior.scale");
      validation::requirePositive(degreesOfFreedom, "prior.degreesOfFreedom");
      return PriorDistribution(StudentTPrior{location, scale, degreesOfFreedom});
    }

    static PriorDistribution makeUniform(double lower, double upper)
    {
      validation::requireFinite(lower, "prior.lower");
      validation::requireFinite(upper, "prior.upper");
      if (!(upper > lower))
	throw ValidationException("prior.upper", "upper bound must exceed lower bound");

      return PriorDistribution(UniformPrior{lower, upper});
    }

    /**
     * @brief Build a prior whose central 90% mass is [lower, upper].
     *
     * Normal: mean at the midpoint, sd = width / (2 * z_0.95).
     * Student-t: location at the midpoint, scale = width / (2 * t_0.95,df),
     *            df restricted to 3, 5 or 10.
     * Uniform: the interval itself.
     *
     * @throws ValidationException for inverted or degenerate intervals
     */
    static PriorDistribution fromCredibleInterval(PriorShape shape,
						  double lower,
						  double upper,
						  double degreesOfFreedom = DEFAULT_STUDENT_T_DF)
    {
      validation::requireFinite(lower, "prior.intervalLow");
      validation::requireFinite(upper, "prior.intervalHigh");
      if (!(upper > lower))
	throw ValidationException("prior.intervalHigh",
				  "interval upper bound must exceed the lower bound");

      const double midpoint = 0.5 * (lower + upper);
      const double halfWidth = 0.5 * (upper - lower);

      switch (shape)
	{
	case PriorShape::Normal:
	  return makeNormal(midpoint,
			    halfWidth / stats::NormalDistribution::criticalValue(CREDIBLE_INTERVAL_LEVEL));

	case PriorShape::StudentT:
	  if (degreesOfFreedom != 3.0 && degreesOfFreedom != 5.0 && degreesOfFreedom != 10.0)
	    throw ValidationException("prior.degreesOfFreedom", "must be 3, 5 or 10");
	  return makeStudentT(midpoint,
			      halfWidth / stats::StudentTDistribution::criticalValue(CREDIBLE_INTERVAL_LEVEL,
										     degreesOfFreedom),
			      degreesOfFreedom);

	case PriorShape::Uniform:
	  return makeUniform(lower, upper);
	}

      throw ValidationException("prior.shape", "unsupported prior shape");
    }

    /**
     * @brief Interval implied by the default Normal(0, 5%) belief, about +/-8.22%.
     */
    static double defaultIntervalHalfWidth()
    {
      return DEFAULT_PRIOR_STD_DEV * stats::NormalDistribution::criticalValue(CREDIBLE_INTERVAL_LEVEL);
    }

    // Default belief for a shape when the user supplies no interval.
    static PriorDistribution makeDefault(PriorShape shape = PriorShape::Normal,
					 double degreesOfFreedom = DEFAULT_STUDENT_T_DF)
    {
      if (shape == PriorShape::Normal)
	return makeNormal(DEFAULT_PRIOR_MEAN, DEFAULT_PRIOR_STD_DEV);

      const double halfWidth = defaultIntervalHalfWidth();
      return fromCredibleInterval(shape, DEFAULT_PRIOR_MEAN - halfWidth,
				  DEFAULT_PRIOR_MEAN + halfWidth, degreesOfFreedom);
    }

    PriorShape shape() const
    {
      switch (mParameters.index())
	{
	case 0:
	  return PriorShape::Normal;
	case 1:
	  return PriorShape::StudentT;
	default:
	  return PriorShape::Uniform;
	}
    }

    const Parameters& parameters() const
    {
      return mParameters;
    }

    const NormalPrior& normal() const
    {
      return std::get<NormalPrior>(mParameters);
    }

    const StudentTPrior& studentT() const
    {
      return std::get<StudentTPrior>(mParameters);
    }

    const UniformPrior& uniform() const
    {
      return std::get<UniformPrior>(mParameters);
    }

    /**
     * @brief Untruncated mean (location for Normal and Student-t, midpoint for Uniform).
     */
    double mean() const
    {
      switch (shape())
	{
	case PriorShape::Normal:
	  return normal().mean;
	case PriorShape::StudentT:
	  return studentT().location;
	case PriorShape::Uniform:
	  return 0.5 * (uniform().lower + uniform().upper);
	}
      return 0.0;
    }

    /**
     * @brief Spread parameter: sd, scale, or the uniform standard deviation.
     */
    double spread() const
    {
      switch (shape())
	{
	case PriorShape::Normal:
	  return normal().stdDev;
	case PriorShape::StudentT:
	  return studentT().scale;
	case PriorShape::Uniform:
	  return (uniform().upper - uniform().lower) / std::sqrt(12.0);
	}
      return 0.0;
    }

    double pdf(double x) const
    {
      switch (shape())
	{
	case PriorShape::Normal:
	  return stats::NormalDistribution::pdf(x, normal().mean, normal().stdDev);
	case PriorShape::StudentT:
	  return studentTDistribution().pdf(x);
	case PriorShape::Uniform:
	  {
	    const UniformPrior& u = uniform();
	    return (x >= u.lower && x <= u.upper) ? 1.0 / (u.upper - u.lower) : 0.0;
	  }
	}
      return 0.0;
    }

    double cdf(double x) const
    {
      switch (shape())
	{
	case PriorShape::Normal:
	  return stats::NormalDistribution::cdf(x, normal().mean, normal().stdDev);
	case PriorShape::StudentT:
	  return studentTDistribution().cdf(x);
	case PriorShape::Uniform:
	  {
	    const UniformPrior& u = uniform();
	    if (x <= u.lower)
	      return 0.0;
	    if (x >= u.upper)
	      return 1.0;
	    return (x - u.lower) / (u.upper - u.lower);
	  }
	}
      return 0.0;
    }

    /**
     * @brief Untruncated inverse CDF.
     *
     * @throws NumericalException for p outside (0, 1) on unbounded shapes
     */
    double quantile(double p) const
    {
      if (!(p >= 0.0 && p <= 1.0))
	throw NumericalException("prior quantile probability outside [0, 1]");

      switch (shape())
	{
	case PriorShape::Normal:
	  if (p == 0.0 || p == 1.0)
	    throw NumericalException("normal prior quantile is unbounded at 0 and 1");
	  return stats::NormalDistribution::quantile(p, normal().mean, normal().stdDev);

	case PriorShape::StudentT:
	  if (p == 0.0 || p == 1.0)
	    throw NumericalException("student-t prior quantile is unbounded at 0 and 1");
	  return studentTDistribution().quantile(p);

	case PriorShape::Uniform:
	  return uniform().lower + p * (uniform().upper - uniform().lower);
	}
      return 0.0;
    }

    /**
     * @brief Untruncated probability mass below the -100% lift floor, CDF(-1).
     */
    double truncationMass() const
    {
      return cdf(LIFT_LOWER_BOUND);
    }

    bool truncationSignificant() const
    {
      return truncationMass() > TRUNCATION_SIGNIFICANCE_THRESHOLD;
    }

    double truncatedPdf(double x) const
    {
      if (x < LIFT_LOWER_BOUND)
	return 0.0;
      return pdf(x) / massAboveFloor();
    }

    double truncatedCdf(double x) const
    {
      if (x < LIFT_LOWER_BOUND)
	return 0.0;

      const double below = truncationMass();
      return (cdf(x) - below) / massAboveFloor();
    }

    double truncatedQuantile(double p) const
    {
      if (!(p >= 0.0 && p <= 1.0))
	throw NumericalException("truncated prior quantile probability outside [0, 1]");

      const double below = truncationMass();
      const double target = below + p * massAboveFloor();
      if (shape() != PriorShape::Uniform)
	{
	  if (target <= 0.0)
	    return LIFT_LOWER_BOUND;
	  if (target >= 1.0)
	    return std::numeric_limits<double>::infinity();
	}

      const double x = quantile(target);
      return x < LIFT_LOWER_BOUND ? LIFT_LOWER_BOUND : x;
    }

    /**
     * @brief Draw one untruncated lift.
     *
     * Callers that need the physical range reject draws outside it.
     */
    template <typename Rng>
    double sample(Rng& rng) const
    {
      switch (shape())
	{
	case PriorShape::Normal:
	  return normal().mean + normal().stdDev * rng_utils::get_standard_normal(rng);
	case PriorShape::StudentT:
	  return studentTDistribution().quantile(rng_utils::get_random_uniform_open01(rng));
	case PriorShape::Uniform:
	  return uniform().lower + (uniform().upper - uniform().lower) * rng_utils::get_random_uniform_01(rng);
	}
      return 0.0;
    }

    std::string describe() const
    {
      std::ostringstream out;
      switch (shape())
	{
	case PriorShape::Normal:
	  out << "Normal(mean=" << normal().mean << ", sd=" << normal().stdDev << ")";
	  break;
	case PriorShape::StudentT:
	  out << "StudentT(location=" << studentT().location << ", scale=" << studentT().scale
	      << ", df=" << studentT().degreesOfFreedom << ")";
	  break;
	case PriorShape::Uniform:
	  out << "Uniform(" << uniform().lower << ", " << uniform().upper << ")";
	  break;
	}
      return out.str();
    }

  private:
    explicit PriorDistribution(Parameters parameters)
      : mParameters(parameters)
    {}

    stats::StudentTDistribution studentTDistribution() const
    {
      const StudentTPrior& t = studentT();
      return stats::StudentTDistribution(t.location, t.scale, t.degreesOfFreedom);
    }

    double massAboveFloor() const
    {
      const double mass = 1.0 - truncationMass();
      if (!(mass > 0.0))
	throw NumericalException("prior " + describe() + " has no mass at or above a -100% lift");
      return mass;
    }

    Parameters mParameters;
  };

} // namespace abvalue

#endif // __PRIOR_DISTRIBUTION_H
