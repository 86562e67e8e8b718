#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "DecisionResults.h"
#include "ScenarioConfiguration.h"
#include "ScenarioResults.h"

namespace abvalue {
namespace cli {

/**
 * @brief Plain-text report of a scenario and its results.
 *
 * Dollar amounts are rounded to cents, probabilities and lifts are shown as
 * percentages.
 */
class ReportWriter {
public:
    explicit ReportWriter(std::ostream& out);

    void writeScenario(const ScenarioConfiguration& scenario);
    void writeEvpi(const EvpiResult& result);
    void writeEvsi(const EvsiResult& result);
    void writeNetValue(const NetValueResult& result);
    void writeAll(const ScenarioConfiguration& scenario, const ScenarioResults& results);

    static std::string formatDollars(double dollars);
    static std::string formatPercent(double fraction);

private:
    void writeHeading(const std::string& title);
    void writeLine(const std::string& label, const std::string& value);
    void writeWarnings(const std::vector<CalculationWarning>& warnings, bool truncationSignificant);

    std::ostream& mOut;
};

} // namespace cli
} // namespace abvalue
