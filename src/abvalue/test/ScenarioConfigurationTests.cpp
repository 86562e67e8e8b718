#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <fstream>
#include "ScenarioConfiguration.h"
#include "DecisionException.h"

using Catch::Approx;
using namespace abvalue;
using namespace abvalue::cli;

namespace {

const char* FULL_SCENARIO = R"({
    "business": { "baselineConversionRate": 0.05, "annualVisitors": 100000, "valuePerConversion": 10 },
    "threshold": { "scenario": "minimum-lift", "value": 500, "unit": "dollars" },
    "prior": { "shape": "student-t", "intervalLow": -0.1, "intervalHigh": 0.1, "df": 10 },
    "design": { "testDurationDays": 14, "dailyTraffic": 2000, "variantFraction": 0.5,
                "eligibilityFraction": 0.8, "conversionLatencyDays": 3, "decisionLatencyDays": 2 },
    "costs": { "fixedTestCost": 1500, "laborHours": 8, "laborHourlyRate": 75, "dailyCostOfDelay": 10 },
    "simulation": { "numSamples": 20000, "seed": 1234 }
})";

const char* MINIMAL_SCENARIO = R"({
    "business": { "baselineConversionRate": 0.1, "annualVisitors": 50000, "valuePerConversion": 20 },
    "design": { "testDurationDays": 21, "dailyTraffic": 500 }
})";

std::string expectFieldError(const std::string& json)
{
    try {
        ScenarioConfigurationReader::readFromJson(json);
    }
    catch (const ValidationException& e) {
        return e.fieldName();
    }
    FAIL("expected a ValidationException");
    return "";
}

} // namespace

TEST_CASE("ScenarioConfigurationReader reads every section", "[ScenarioConfiguration]")
{
    const ScenarioConfiguration scenario = ScenarioConfigurationReader::readFromJson(FULL_SCENARIO);

    REQUIRE(scenario.getBusiness().dollarsPerUnitLift() == Approx(50000.0));

    // $500 against K = 50,000
    REQUIRE(scenario.thresholdLift() == Approx(0.01));

    REQUIRE(scenario.getPrior().shape() == PriorShape::StudentT);
    REQUIRE(scenario.getPrior().studentT().degreesOfFreedom == 10.0);
    REQUIRE(scenario.getPrior().studentT().location == Approx(0.0).margin(1e-15));

    REQUIRE(scenario.getDesign().eligibilityFraction == 0.8);
    REQUIRE(scenario.getDesign().latencyDays() == 5.0);

    REQUIRE(scenario.getCosts().laborCost() == Approx(600.0));
    REQUIRE(scenario.getCosts().dailyCostOfDelay == 10.0);

    REQUIRE(scenario.getSimulation().numSamples == 20000);
    REQUIRE(scenario.getSimulation().seed.has_value());
    REQUIRE(*scenario.getSimulation().seed == 1234u);

    const NetValueInputs inputs = scenario.netValueInputs();
    REQUIRE(inputs.thresholdLift == Approx(0.01));
    REQUIRE(inputs.costs.fixedTestCost == 1500.0);
}

TEST_CASE("ScenarioConfigurationReader applies defaults", "[ScenarioConfiguration]")
{
    const ScenarioConfiguration scenario = ScenarioConfigurationReader::readFromJson(MINIMAL_SCENARIO);

    REQUIRE(scenario.getThreshold().scenario == ThresholdScenario::AnyPositive);
    REQUIRE(scenario.thresholdLift() == 0.0);

    REQUIRE(scenario.getPrior().shape() == PriorShape::Normal);
    REQUIRE(scenario.getPrior().normal().mean == 0.0);
    REQUIRE(scenario.getPrior().normal().stdDev == 0.05);

    REQUIRE(scenario.getDesign().variantFraction == 0.5);
    REQUIRE(scenario.getDesign().eligibilityFraction == 1.0);

    REQUIRE(scenario.getCosts().fixedTestCost == 0.0);
    REQUIRE(scenario.getSimulation().numSamples == DEFAULT_MONTE_CARLO_SAMPLES);
    REQUIRE_FALSE(scenario.getSimulation().seed.has_value());

    SECTION("Prior shape without an interval uses the default interval")
    {
        const ScenarioConfiguration uniform = ScenarioConfigurationReader::readFromJson(R"({
            "business": { "baselineConversionRate": 0.1, "annualVisitors": 50000, "valuePerConversion": 20 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500 },
            "prior": { "shape": "uniform" }
        })");
        REQUIRE(uniform.getPrior().uniform().upper == Approx(PriorDistribution::defaultIntervalHalfWidth()));
    }
}

TEST_CASE("Command-line overrides", "[ScenarioConfiguration]")
{
    ScenarioConfiguration scenario = ScenarioConfigurationReader::readFromJson(MINIMAL_SCENARIO);
    scenario.setNumSamples(123);
    scenario.setSeed(99);

    REQUIRE(scenario.getSimulation().numSamples == 123);
    REQUIRE(*scenario.getSimulation().seed == 99u);
    REQUIRE_THROWS_AS(scenario.setNumSamples(0), ValidationException);
}

TEST_CASE("ScenarioConfigurationReader reports the JSON path of bad fields", "[ScenarioConfiguration][error]")
{
    SECTION("Missing section")
    {
        REQUIRE(expectFieldError(R"({ "business": { "baselineConversionRate": 0.1,
            "annualVisitors": 1, "valuePerConversion": 1 } })") == "design");
    }

    SECTION("Missing required field")
    {
        REQUIRE(expectFieldError(R"({
            "business": { "baselineConversionRate": 0.1, "valuePerConversion": 20 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500 } })") == "business.annualVisitors");
    }

    SECTION("Wrong type")
    {
        REQUIRE(expectFieldError(R"({
            "business": { "baselineConversionRate": "five percent", "annualVisitors": 1, "valuePerConversion": 1 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500 } })") == "business.baselineConversionRate");
    }

    SECTION("Out of range value")
    {
        REQUIRE(expectFieldError(R"({
            "business": { "baselineConversionRate": 0.1, "annualVisitors": 50000, "valuePerConversion": 20 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500, "variantFraction": 1.5 } })")
                == "design.variantFraction");
    }

    SECTION("Half an interval")
    {
        REQUIRE(expectFieldError(R"({
            "business": { "baselineConversionRate": 0.1, "annualVisitors": 50000, "valuePerConversion": 20 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500 },
            "prior": { "intervalLow": -0.05 } })") == "prior.intervalHigh");
    }

    SECTION("Minimum lift without a value")
    {
        REQUIRE(expectFieldError(R"({
            "business": { "baselineConversionRate": 0.1, "annualVisitors": 50000, "valuePerConversion": 20 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500 },
            "threshold": { "scenario": "minimum-lift" } })") == "threshold.value");
    }

    SECTION("Unknown prior shape")
    {
        REQUIRE(expectFieldError(R"({
            "business": { "baselineConversionRate": 0.1, "annualVisitors": 50000, "valuePerConversion": 20 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500 },
            "prior": { "shape": "cauchy" } })") == "prior.shape");
    }

    SECTION("Zero samples")
    {
        REQUIRE(expectFieldError(R"({
            "business": { "baselineConversionRate": 0.1, "annualVisitors": 50000, "valuePerConversion": 20 },
            "design": { "testDurationDays": 21, "dailyTraffic": 500 },
            "simulation": { "numSamples": 0 } })") == "simulation.numSamples");
    }

    SECTION("Malformed JSON")
    {
        REQUIRE(expectFieldError("{ \"business\": ") == "scenario");
    }
}

TEST_CASE("ScenarioConfigurationReader reads files", "[ScenarioConfiguration][file]")
{
    const std::string path = "abvalue_test_scenario.json";
    {
        std::ofstream out(path);
        out << FULL_SCENARIO;
    }

    const ScenarioConfiguration scenario = ScenarioConfigurationReader::readFromFile(path);
    REQUIRE(scenario.getSimulation().numSamples == 20000);
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(ScenarioConfigurationReader::readFromFile("no_such_scenario.json"), std::runtime_error);
}
