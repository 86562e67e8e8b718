#pragma once

#include "DecisionResults.h"
#include "ExperimentInputs.h"

namespace abvalue
{
  /**
   * @brief Opportunity cost of postponing a launch to run the test.
   *
   * Evaluated at the prior mean. Applies only when shipping now has positive
   * expected value, EV_day = K * (mu - T) / 365 > 0. Control users forgo the
   * change during the test and everyone forgoes it while the decision is made:
   *
   *   CoD = (1 - f_variant) * EV_day * D_test + EV_day * D_decision
   */
  inline CostOfDelayBreakdown computeCostOfDelay(double K,
						 double priorMean,
						 double thresholdLift,
						 const TestDesign& design)
  {
    CostOfDelayBreakdown cod;

    const double annualExpectedValue = K * (priorMean - thresholdLift);
    if (!(annualExpectedValue > 0.0))
      return cod;

    cod.applies = true;
    cod.dailyOpportunityCost = annualExpectedValue / DAYS_PER_YEAR;
    cod.duringTestDollars = (1.0 - design.variantFraction) * cod.dailyOpportunityCost * design.testDurationDays;
    cod.duringLatencyDollars = cod.dailyOpportunityCost * design.decisionLatencyDays;
    cod.codDollars = cod.duringTestDollars + cod.duringLatencyDollars;
    return cod;
  }
}
