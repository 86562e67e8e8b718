#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include "ReportWriter.h"
#include "ScenarioConfiguration.h"

using namespace abvalue;
using namespace abvalue::cli;

namespace {

bool contains(const std::string& text, const std::string& fragment)
{
    return text.find(fragment) != std::string::npos;
}

ScenarioConfiguration referenceScenario()
{
    return ScenarioConfigurationReader::readFromJson(R"({
        "business": { "baselineConversionRate": 0.05, "annualVisitors": 100000, "valuePerConversion": 10 },
        "prior": { "shape": "normal", "intervalLow": -0.1, "intervalHigh": 0.1 },
        "design": { "testDurationDays": 20, "dailyTraffic": 1000 },
        "costs": { "fixedTestCost": 250 },
        "simulation": { "numSamples": 2000, "seed": 5 }
    })");
}

} // namespace

TEST_CASE("ReportWriter formats dollars and percentages", "[ReportWriter]")
{
    REQUIRE(ReportWriter::formatDollars(4.245351308414835) == "$4.25");
    REQUIRE(ReportWriter::formatDollars(1234567.891) == "$1,234,567.89");
    REQUIRE(ReportWriter::formatDollars(-1500.0) == "-$1,500.00");
    REQUIRE(ReportWriter::formatDollars(-0.001) == "$0.00");
    REQUIRE(ReportWriter::formatDollars(999.999) == "$1,000.00");

    REQUIRE(ReportWriter::formatPercent(0.0512) == "5.12%");
    REQUIRE(ReportWriter::formatPercent(-0.02) == "-2.00%");
}

TEST_CASE("ReportWriter writes every requested section", "[ReportWriter]")
{
    const ScenarioConfiguration scenario = referenceScenario();

    ScenarioResults results;
    results.evpi = computeEvpi(scenario.evpiInputs());
    results.evsi = computeEvsi(scenario.evsiInputs(), scenario.getSimulation());
    results.netValue = computeNetValue(scenario.netValueInputs(), scenario.getSimulation());

    std::ostringstream out;
    ReportWriter writer(out);
    writer.writeAll(scenario, results);
    const std::string report = out.str();

    REQUIRE(contains(report, "Scenario"));
    REQUIRE(contains(report, "$50,000.00"));
    REQUIRE(contains(report, "any positive lift"));
    REQUIRE(contains(report, "Expected Value of Perfect Information"));
    REQUIRE(contains(report, "Expected Value of Sample Information"));
    REQUIRE(contains(report, "normal-fast-path"));
    REQUIRE(contains(report, "Net Value of Testing"));
    REQUIRE(contains(report, "$250.00"));
    REQUIRE(contains(report, "10000 / 10000"));
    REQUIRE_FALSE(contains(report, "Warning"));
}

TEST_CASE("ReportWriter omits sections that were not computed", "[ReportWriter]")
{
    const ScenarioConfiguration scenario = referenceScenario();

    ScenarioResults results;
    results.evpi = computeEvpi(scenario.evpiInputs());

    std::ostringstream out;
    ReportWriter(out).writeAll(scenario, results);

    REQUIRE(contains(out.str(), "EVPI"));
    REQUIRE_FALSE(contains(out.str(), "Sample Information"));
    REQUIRE_FALSE(contains(out.str(), "Net Value of Testing"));
}

TEST_CASE("ReportWriter surfaces warnings", "[ReportWriter]")
{
    EvsiResult evsi;
    evsi.truncationSignificant = true;
    evsi.warnings.push_back(CalculationWarning{"rare_events", "Expected conversions per group are low (<20)."});

    std::ostringstream out;
    ReportWriter(out).writeEvsi(evsi);

    REQUIRE(contains(out.str(), "Warning [truncation]"));
    REQUIRE(contains(out.str(), "Warning [rare_events]"));
}
