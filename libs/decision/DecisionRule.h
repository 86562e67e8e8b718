#pragma once

#include <string>

namespace abvalue
{
  enum class Decision
  {
    Ship,
    DontShip
  };

  /**
   * @brief The single ship / don't-ship rule used by every calculator.
   *
   * Ships when the point estimate reaches the threshold. Ties ship, for
   * negative thresholds as well.
   *
   * @param pointEstimate Prior mean (default decision) or posterior mean (post-test decision)
   * @param threshold     Decision threshold expressed as a lift
   */
  inline Decision decide(double pointEstimate, double threshold) noexcept
  {
    return pointEstimate >= threshold ? Decision::Ship : Decision::DontShip;
  }

  inline bool isShip(Decision d) noexcept
  {
    return d == Decision::Ship;
  }

  inline std::string decisionToString(Decision d)
  {
    return d == Decision::Ship ? "ship" : "dont-ship";
  }
}
