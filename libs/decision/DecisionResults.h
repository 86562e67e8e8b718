// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __DECISION_RESULTS_H
#define __DECISION_RESULTS_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "DecisionRule.h"
#include "ExperimentInputs.h"

namespace abvalue
{
  /**
   * @brief Non-fatal caveat attached to a result.
   *
   * Codes are stable identifiers ("rare_events", "high_rejection") so a
   * presentation layer can map them to its own wording.
   */
  struct CalculationWarning
  {
    std::string code;
    std::string message;
  };

  inline bool hasWarning(const std::vector<CalculationWarning>& warnings, const std::string& code)
  {
    for (const auto& w : warnings)
      if (w.code == code)
	return true;
    return false;
  }

  // Normal-prior diagnostics, z = (T - mu) / sigma.
  struct NormalDiagnostics
  {
    double zScore;
    double phiZ;   // standard normal density at z
    double PhiZ;   // standard normal CDF at z
  };

  struct EdgeCaseFlags
  {
    bool nearZeroSigma = false;   // sigma < 0.001, belief is effectively certain
    bool priorOneSided = false;   // essentially all mass on one side of the threshold
  };

  struct EvpiResult
  {
    double evpiDollars = 0.0;
    Decision defaultDecision = Decision::Ship;
    double K = 0.0;
    double thresholdLift = 0.0;
    double thresholdDollars = 0.0;
    double priorMean = 0.0;
    double probabilityClearsThreshold = 0.0;   // P(L >= T)
    double chanceOfBeingWrong = 0.0;           // probability the default decision is wrong
    std::optional<NormalDiagnostics> normalDiagnostics;
    EdgeCaseFlags edgeCases;
    bool truncationSignificant = false;
  };

  enum class EvsiMethod
  {
    NormalFastPath,
    MonteCarlo
  };

  inline std::string evsiMethodToString(EvsiMethod method)
  {
    return method == EvsiMethod::NormalFastPath ? "normal-fast-path" : "monte-carlo";
  }

  struct EvsiResult
  {
    double evsiDollars = 0.0;
    double evpiDollars = 0.0;
    double fractionOfEvpi = 0.0;               // EVSI / EVPI, zero when EVPI is zero
    Decision defaultDecision = Decision::Ship;
    double probabilityClearsThreshold = 0.0;
    double probabilityTestChangesDecision = 0.0;
    bool truncationSignificant = false;
    EvsiMethod method = EvsiMethod::NormalFastPath;
    SampleSizes sampleSizes{0, 0, 0};
    double liftStandardError = 0.0;            // SE of the relative lift estimate
    std::optional<double> monteCarloStandardError;
    std::size_t numSamples = 0;
    std::size_t numRejected = 0;
    std::vector<CalculationWarning> warnings;
  };

  /**
   * @brief Opportunity cost of waiting for a test, at the prior mean.
   *
   * Informational only. Net value already prices the delay through its
   * simulated timeline.
   */
  struct CostOfDelayBreakdown
  {
    double codDollars = 0.0;
    double dailyOpportunityCost = 0.0;
    double duringTestDollars = 0.0;
    double duringLatencyDollars = 0.0;
    bool applies = false;
  };

  enum class TestVerdict
  {
    TestThis,
    DontTest
  };

  inline std::string testVerdictToString(TestVerdict verdict)
  {
    return verdict == TestVerdict::TestThis ? "test-this" : "dont-test";
  }

  struct NetValueResult
  {
    double netValueDollars = 0.0;
    TestVerdict verdict = TestVerdict::DontTest;
    Decision defaultDecision = Decision::Ship;
    double avgValueDuringTest = 0.0;
    double avgValueAfterDecision = 0.0;
    double avgValueWithTest = 0.0;
    double avgValueWithoutTest = 0.0;
    double grossValueDollars = 0.0;            // avgValueWithTest - avgValueWithoutTest
    double fixedCostDollars = 0.0;
    double laborCostDollars = 0.0;
    double delayCostDollars = 0.0;
    double totalCostDollars = 0.0;
    double probabilityTestChangesDecision = 0.0;
    double monteCarloStandardError = 0.0;
    CostOfDelayBreakdown costOfDelay;
    SampleSizes sampleSizes{0, 0, 0};
    std::size_t numSamples = 0;
    std::size_t numRejected = 0;
    bool truncationSignificant = false;
    std::vector<CalculationWarning> warnings;
  };

} // namespace abvalue

#endif // __DECISION_RESULTS_H
