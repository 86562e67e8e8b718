// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __DECISION_EXCEPTION_H
#define __DECISION_EXCEPTION_H 1

#include <cmath>
#include <stdexcept>
#include <string>

namespace abvalue
{
  // Base class of every error raised by the decision engine
  class DecisionEngineException : public std::runtime_error
  {
  public:
    explicit DecisionEngineException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~DecisionEngineException() = default;
  };

  /**
   * @brief An input is outside its domain.
   *
   * Raised before any computation starts. fieldName() identifies the
   * offending input so a caller can point at it.
   */
  class ValidationException : public DecisionEngineException
  {
  public:
    ValidationException(const std::string& fieldName, const std::string& msg)
      : DecisionEngineException("Invalid " + fieldName + ": " + msg),
        mFieldName(fieldName)
    {}

    const std::string& fieldName() const noexcept
    {
      return mFieldName;
    }

  private:
    std::string mFieldName;
  };

  // A derived quantity became NaN or infinite, or a distribution has no usable mass.
  class NumericalException : public DecisionEngineException
  {
  public:
    explicit NumericalException(const std::string& msg)
      : DecisionEngineException(msg)
    {}
  };

  namespace validation
  {
    inline void requireFinite(double value, const std::string& field)
    {
      if (!std::isfinite(value))
	throw ValidationException(field, "must be a finite number");
    }

    inline void requirePositive(double value, const std::string& field)
    {
      requireFinite(value, field);
      if (!(value > 0.0))
	throw ValidationException(field, "must be greater than zero");
    }

    inline void requireNonNegative(double value, const std::string& field)
    {
      requireFinite(value, field);
      if (value < 0.0)
	throw ValidationException(field, "must not be negative");
    }

    // Open unit interval (0, 1)
    inline void requireOpenUnit(double value, const std::string& field)
    {
      requireFinite(value, field);
      if (!(value > 0.0 && value < 1.0))
	throw ValidationException(field, "must be strictly between 0 and 1");
    }

    // Half-open unit interval (0, 1]
    inline void requireFraction(double value, const std::string& field)
    {
      requireFinite(value, field);
      if (!(value > 0.0 && value <= 1.0))
	throw ValidationException(field, "must be in (0, 1]");
    }

    inline double requireFiniteResult(double value, const std::string& quantity)
    {
      if (!std::isfinite(value))
	throw NumericalException(quantity + " is not a finite number");
      return value;
    }
  } // namespace validation

} // namespace abvalue

#endif // __DECISION_EXCEPTION_H
