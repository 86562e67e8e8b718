// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//
// Business, threshold, test design and cost inputs, plus the quantities
// derived from them (K, threshold in lift units, sample sizes, sampling noise).

#ifndef __EXPERIMENT_INPUTS_H
#define __EXPERIMENT_INPUTS_H 1

#include <cmath>
#include <cstdint>
#include <string>
#include "DecisionException.h"

namespace abvalue
{
  constexpr double DAYS_PER_YEAR = 365.0;

  /**
   * @brief Baseline business figures that convert lift into dollars.
   */
  struct BusinessInputs
  {
    double baselineConversionRate;   // CR0, decimal in (0, 1)
    double annualVisitors;           // N
    double valuePerConversion;       // V, dollars

    void validate() const
    {
      validation::requireOpenUnit(baselineConversionRate, "business.baselineConversionRate");
      validation::requirePositive(annualVisitors, "business.annualVisitors");
      validation::requirePositive(valuePerConversion, "business.valuePerConversion");
    }

    /**
     * @brief K = CR0 * N * V, annual dollars per unit of lift.
     */
    double dollarsPerUnitLift() const
    {
      return baselineConversionRate * annualVisitors * valuePerConversion;
    }
  };

  enum class ThresholdScenario
  {
    AnyPositive,   // ship on any improvement, T = 0
    MinimumLift,   // ship only above a positive bar
    AcceptLoss     // ship even with a bounded loss, T <= 0
  };

  enum class ThresholdUnit
  {
    Lift,          // value is a percentage, 5 means 5%
    Dollars        // value is annual dollars
  };

  inline ThresholdScenario thresholdScenarioFromString(const std::string& name)
  {
    if (name == "any-positive")
      return ThresholdScenario::AnyPositive;
    if (name == "minimum-lift")
      return ThresholdScenario::MinimumLift;
    if (name == "accept-loss")
      return ThresholdScenario::AcceptLoss;

    throw ValidationException("threshold.scenario", "unknown scenario '" + name + "'");
  }

  inline ThresholdUnit thresholdUnitFromString(const std::string& name)
  {
    if (name == "lift")
      return ThresholdUnit::Lift;
    if (name == "dollars")
      return ThresholdUnit::Dollars;

    throw ValidationException("threshold.unit", "unknown unit '" + name + "'");
  }

  struct ThresholdSpec
  {
    ThresholdScenario scenario = ThresholdScenario::AnyPositive;
    double value = 0.0;
    ThresholdUnit unit = ThresholdUnit::Lift;
  };

  /**
   * @brief Convert a threshold to lift units (decimal).
   *
   * Dollars divide by K, lift percentages divide by 100, and the any-positive
   * scenario is always zero.
   *
   * @throws ValidationException when the sign of the value contradicts the scenario
   */
  inline double normalizeThresholdToLift(const ThresholdSpec& threshold, double K)
  {
    if (threshold.scenario == ThresholdScenario::AnyPositive)
      return 0.0;

    validation::requireFinite(threshold.value, "threshold.value");

    if (threshold.scenario == ThresholdScenario::MinimumLift && threshold.value < 0.0)
      throw ValidationException("threshold.value", "minimum-lift threshold must not be negative");

    if (threshold.scenario == ThresholdScenario::AcceptLoss && threshold.value > 0.0)
      throw ValidationException("threshold.value", "accept-loss threshold must not be positive");

    if (threshold.unit == ThresholdUnit::Dollars)
      {
	validation::requirePositive(K, "business.K");
	return threshold.value / K;
      }

    return threshold.value / 100.0;
  }

  /**
   * @brief Proposed A/B test. Used by EVSI and Net Value only.
   */
  struct TestDesign
  {
    double testDurationDays;
    double dailyTraffic;
    double variantFraction = 0.5;       // share of eligible traffic in the variant
    double eligibilityFraction = 1.0;   // share of traffic entering the test
    double conversionLatencyDays = 0.0;
    double decisionLatencyDays = 0.0;

    void validate() const
    {
      validation::requirePositive(testDurationDays, "design.testDurationDays");
      validation::requirePositive(dailyTraffic, "design.dailyTraffic");
      validation::requireOpenUnit(variantFraction, "design.variantFraction");
      validation::requireFraction(eligibilityFraction, "design.eligibilityFraction");
      validation::requireNonNegative(conversionLatencyDays, "design.conversionLatencyDays");
      validation::requireNonNegative(decisionLatencyDays, "design.decisionLatencyDays");
    }

    double latencyDays() const
    {
      return conversionLatencyDays + decisionLatencyDays;
    }

    // Days from test start until the decision takes effect.
    double daysUntilDecision() const
    {
      return testDurationDays + latencyDays();
    }
  };

  struct CostInputs
  {
    double fixedTestCost = 0.0;
    double laborHours = 0.0;
    double laborHourlyRate = 0.0;
    double dailyCostOfDelay = 0.0;

    void validate() const
    {
      validation::requireNonNegative(fixedTestCost, "costs.fixedTestCost");
      validation::requireNonNegative(laborHours, "costs.laborHours");
      validation::requireNonNegative(laborHourlyRate, "costs.laborHourlyRate");
      validation::requireNonNegative(dailyCostOfDelay, "costs.dailyCostOfDelay");
    }

    double laborCost() const
    {
      return laborHours * laborHourlyRate;
    }
  };

  struct SampleSizes
  {
    std::int64_t total;
    std::int64_t control;
    std::int64_t variant;
  };

  /**
   * @brief Split the test's traffic into control and variant arms.
   *
   * n_total = floor(daily * days * eligibility), n_variant = floor(n_total * f),
   * n_control = n_total - n_variant.
   *
   * @throws ValidationException if either arm would be empty
   */
  inline SampleSizes deriveSampleSizes(const TestDesign& design)
  {
    design.validate();

    const double rawTotal = design.dailyTraffic * design.testDurationDays * design.eligibilityFraction;
    if (!(rawTotal < 9.0e15))
      throw ValidationException("design.dailyTraffic", "test traffic is too large to represent");

    SampleSizes n;
    n.total = static_cast<std::int64_t>(std::floor(rawTotal));
    n.variant = static_cast<std::int64_t>(std::floor(static_cast<double>(n.total) * design.variantFraction));
    n.control = n.total - n.variant;

    if (n.variant <= 0)
      throw ValidationException("design.variantFraction", "the variant arm receives no visitors");
    if (n.control <= 0)
      throw ValidationException("design.variantFraction", "the control arm receives no visitors");

    return n;
  }

  /**
   * @brief Standard error of the relative lift estimate from a two-arm test.
   *
   * SE^2 = (1 - CR0) / CR0 * (1 / n_control + 1 / n_variant)
   */
  inline double liftStandardError(double baselineConversionRate, const SampleSizes& n)
  {
    validation::requireOpenUnit(baselineConversionRate, "business.baselineConversionRate");
    if (n.control <= 0 || n.variant <= 0)
      throw ValidationException("design.sampleSize", "both arms need at least one visitor");

    const double varianceFactor = (1.0 - baselineConversionRate) / baselineConversionRate;
    const double sampleFactor = 1.0 / static_cast<double>(n.control) + 1.0 / static_cast<double>(n.variant);
    const double se = std::sqrt(varianceFactor * sampleFactor);

    if (!(se > 0.0) || !std::isfinite(se))
      throw NumericalException("standard error of the lift estimate is degenerate");

    return se;
  }

  /**
   * @brief Physically feasible lift range.
   *
   * CR1 = CR0 * (1 + L) must stay in [0, 1], so L lies in [-1, 1/CR0 - 1].
   */
  struct LiftBounds
  {
    double lower;
    double upper;

    bool contains(double lift) const
    {
      return lift >= lower && lift <= upper;
    }
  };

  inline LiftBounds liftFeasibilityBounds(double baselineConversionRate)
  {
    validation::requireOpenUnit(baselineConversionRate, "business.baselineConversionRate");
    return LiftBounds{-1.0, 1.0 / baselineConversionRate - 1.0};
  }

} // namespace abvalue

#endif // __EXPERIMENT_INPUTS_H
