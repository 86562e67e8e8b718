#include "ReportWriter.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace abvalue {
namespace cli {

namespace {
    const int LABEL_WIDTH = 36;

    std::string thresholdDescription(const ThresholdSpec& threshold)
    {
        std::ostringstream os;
        switch (threshold.scenario) {
        case ThresholdScenario::AnyPositive:
            return "any positive lift";
        case ThresholdScenario::MinimumLift:
            os << "minimum lift of ";
            break;
        case ThresholdScenario::AcceptLoss:
            os << "accept a loss down to ";
            break;
        }

        if (threshold.unit == ThresholdUnit::Dollars)
            os << ReportWriter::formatDollars(threshold.value) << " per year";
        else
            os << threshold.value << "%";
        return os.str();
    }
}

ReportWriter::ReportWriter(std::ostream& out)
    : mOut(out)
{
}

std::string ReportWriter::formatDollars(double dollars)
{
    const bool negative = dollars < 0.0;
    const long long cents = std::llround(std::fabs(dollars) * 100.0);

    std::string whole = std::to_string(cents / 100);
    for (int pos = static_cast<int>(whole.size()) - 3; pos > 0; pos -= 3)
        whole.insert(static_cast<std::size_t>(pos), ",");

    std::ostringstream os;
    os << (negative && cents != 0 ? "-$" : "$") << whole << "."
       << std::setw(2) << std::setfill('0') << (cents % 100);
    return os.str();
}

std::string ReportWriter::formatPercent(double fraction)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return os.str();
}

void ReportWriter::writeHeading(const std::string& title)
{
    mOut << "\n" << title << "\n" << std::string(title.size(), '-') << "\n";
}

void ReportWriter::writeLine(const std::string& label, const std::string& value)
{
    mOut << "  " << std::left << std::setw(LABEL_WIDTH) << label << value << "\n";
}

void ReportWriter::writeWarnings(const std::vector<CalculationWarning>& warnings, bool truncationSignificant)
{
    if (truncationSignificant)
        mOut << "  Warning [truncation]: more than 0.1% of the prior lies below a -100% lift; "
             << "results use the untruncated closed form where one exists.\n";

    for (const auto& w : warnings)
        mOut << "  Warning [" << w.code << "]: " << w.message << "\n";
}

void ReportWriter::writeScenario(const ScenarioConfiguration& scenario)
{
    const BusinessInputs& business = scenario.getBusiness();
    const TestDesign& design = scenario.getDesign();

    writeHeading("Scenario");
    writeLine("Baseline conversion rate", formatPercent(business.baselineConversionRate));
    writeLine("Annual visitors", std::to_string(std::llround(business.annualVisitors)));
    writeLine("Value per conversion", formatDollars(business.valuePerConversion));
    writeLine("Dollars per 100% lift (K)", formatDollars(business.dollarsPerUnitLift()));
    writeLine("Shipping threshold", thresholdDescription(scenario.getThreshold()));
    writeLine("Prior", scenario.getPrior().describe());

    std::ostringstream designText;
    designText << design.testDurationDays << " days at " << std::llround(design.dailyTraffic)
               << " visitors/day, " << formatPercent(design.variantFraction) << " to variant";
    writeLine("Test design", designText.str());
}

void ReportWriter::writeEvpi(const EvpiResult& result)
{
    writeHeading("Expected Value of Perfect Information");
    writeLine("EVPI", formatDollars(result.evpiDollars));
    writeLine("Default decision", decisionToString(result.defaultDecision));
    writeLine("Threshold (lift)", formatPercent(result.thresholdLift));
    writeLine("Threshold (annual dollars)", formatDollars(result.thresholdDollars));
    writeLine("P(lift clears threshold)", formatPercent(result.probabilityClearsThreshold));
    writeLine("Chance the default is wrong", formatPercent(result.chanceOfBeingWrong));

    if (result.normalDiagnostics) {
        std::ostringstream z;
        z << std::fixed << std::setprecision(4) << result.normalDiagnostics->zScore;
        writeLine("z = (T - mu) / sigma", z.str());
    }

    if (result.edgeCases.nearZeroSigma)
        mOut << "  Note: the prior is nearly certain, so information is worth almost nothing.\n";
    if (result.edgeCases.priorOneSided)
        mOut << "  Note: almost all prior mass lies on one side of the threshold.\n";

    writeWarnings({}, result.truncationSignificant);
}

void ReportWriter::writeEvsi(const EvsiResult& result)
{
    writeHeading("Expected Value of Sample Information");
    writeLine("EVSI", formatDollars(result.evsiDollars));
    writeLine("Share of EVPI", formatPercent(result.fractionOfEvpi));
    writeLine("Method", evsiMethodToString(result.method));
    writeLine("Visitors per arm (control/variant)",
              std::to_string(result.sampleSizes.control) + " / " + std::to_string(result.sampleSizes.variant));
    writeLine("Standard error of lift", formatPercent(result.liftStandardError));
    writeLine("P(test changes decision)", formatPercent(result.probabilityTestChangesDecision));

    if (result.monteCarloStandardError) {
        writeLine("Monte Carlo standard error", formatDollars(*result.monteCarloStandardError));
        writeLine("Samples (accepted/rejected)",
                  std::to_string(result.numSamples) + " / " + std::to_string(result.numRejected));
    }

    writeWarnings(result.warnings, result.truncationSignificant);
}

void ReportWriter::writeNetValue(const NetValueResult& result)
{
    writeHeading("Net Value of Testing");
    writeLine("Net value", formatDollars(result.netValueDollars));
    writeLine("Verdict", testVerdictToString(result.verdict));
    writeLine("Avg value during test", formatDollars(result.avgValueDuringTest));
    writeLine("Avg value after decision", formatDollars(result.avgValueAfterDecision));
    writeLine("Avg value without test", formatDollars(result.avgValueWithoutTest));
    writeLine("Gross value of testing", formatDollars(result.grossValueDollars));
    writeLine("Fixed cost", formatDollars(result.fixedCostDollars));
    writeLine("Labor cost", formatDollars(result.laborCostDollars));
    writeLine("Delay cost", formatDollars(result.delayCostDollars));
    writeLine("Total cost", formatDollars(result.totalCostDollars));
    writeLine("P(test changes decision)", formatPercent(result.probabilityTestChangesDecision));
    writeLine("Monte Carlo standard error", formatDollars(result.monteCarloStandardError));
    writeLine("Samples (accepted/rejected)",
              std::to_string(result.numSamples) + " / " + std::to_string(result.numRejected));

    if (result.costOfDelay.applies)
        writeLine("Opportunity cost of waiting", formatDollars(result.costOfDelay.codDollars));

    writeWarnings(result.warnings, result.truncationSignificant);
}

void ReportWriter::writeAll(const ScenarioConfiguration& scenario, const ScenarioResults& results)
{
    writeScenario(scenario);

    if (results.evpi)
        writeEvpi(*results.evpi);
    if (results.evsi)
        writeEvsi(*results.evsi);
    if (results.netValue)
        writeNetValue(*results.netValue);

    mOut << std::flush;
}

} // namespace cli
} // namespace abvalue
