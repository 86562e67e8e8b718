#include "ScenarioConfiguration.h"
#include <fstream>
#include <iterator>
#include <rapidjson/error/en.h>
#include "DecisionException.h"

using namespace rapidjson;

namespace abvalue {
namespace cli {

ScenarioConfiguration::ScenarioConfiguration(const BusinessInputs& business,
                                             const ThresholdSpec& threshold,
                                             const PriorDistribution& prior,
                                             const TestDesign& design,
                                             const CostInputs& costs,
                                             const MonteCarloOptions& simulation)
    : mBusiness(business),
      mThreshold(threshold),
      mPrior(prior),
      mDesign(design),
      mCosts(costs),
      mSimulation(simulation)
{
}

void ScenarioConfiguration::setNumSamples(std::size_t numSamples)
{
    if (numSamples == 0)
        throw ValidationException("simulation.numSamples", "must be at least 1");
    mSimulation.numSamples = numSamples;
}

void ScenarioConfiguration::setSeed(std::uint64_t seed)
{
    mSimulation.seed = seed;
}

double ScenarioConfiguration::thresholdLift() const
{
    mBusiness.validate();
    return normalizeThresholdToLift(mThreshold, mBusiness.dollarsPerUnitLift());
}

EvpiInputs ScenarioConfiguration::evpiInputs() const
{
    return EvpiInputs{mBusiness, thresholdLift(), mPrior};
}

EvsiInputs ScenarioConfiguration::evsiInputs() const
{
    return EvsiInputs{mBusiness, thresholdLift(), mPrior, mDesign};
}

NetValueInputs ScenarioConfiguration::netValueInputs() const
{
    return NetValueInputs{mBusiness, thresholdLift(), mPrior, mDesign, mCosts};
}

ScenarioConfiguration ScenarioConfigurationReader::readFromFile(const std::string& filePath)
{
    std::ifstream file(filePath);
    if (!file.is_open())
        throw std::runtime_error("Cannot open scenario file: " + filePath);

    std::string jsonText((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return readFromJson(jsonText);
}

ScenarioConfiguration ScenarioConfigurationReader::readFromJson(const std::string& jsonText)
{
    Document doc;
    doc.Parse(jsonText.c_str());

    if (doc.HasParseError()) {
        throw ValidationException("scenario",
                                  std::string("JSON parse error at offset ") +
                                  std::to_string(doc.GetErrorOffset()) + ": " +
                                  GetParseError_En(doc.GetParseError()));
    }

    if (!doc.IsObject())
        throw ValidationException("scenario", "top level must be a JSON object");

    return parseDocument(doc);
}

ScenarioConfiguration ScenarioConfigurationReader::parseDocument(const Document& doc)
{
    const BusinessInputs business = parseBusiness(requireSection(doc, "business"));
    const TestDesign design = parseDesign(requireSection(doc, "design"));

    ThresholdSpec threshold;
    if (doc.HasMember("threshold"))
        threshold = parseThreshold(requireSection(doc, "threshold"));

    PriorDistribution prior = PriorDistribution::makeDefault();
    if (doc.HasMember("prior"))
        prior = parsePrior(requireSection(doc, "prior"));

    CostInputs costs;
    if (doc.HasMember("costs"))
        costs = parseCosts(requireSection(doc, "costs"));

    MonteCarloOptions simulation;
    if (doc.HasMember("simulation"))
        simulation = parseSimulation(requireSection(doc, "simulation"));

    return ScenarioConfiguration(business, threshold, prior, design, costs, simulation);
}

BusinessInputs ScenarioConfigurationReader::parseBusiness(const Value& section)
{
    BusinessInputs business;
    business.baselineConversionRate = requireNumber(section, "business", "baselineConversionRate");
    business.annualVisitors = requireNumber(section, "business", "annualVisitors");
    business.valuePerConversion = requireNumber(section, "business", "valuePerConversion");
    business.validate();
    return business;
}

ThresholdSpec ScenarioConfigurationReader::parseThreshold(const Value& section)
{
    ThresholdSpec threshold;
    threshold.scenario = thresholdScenarioFromString(
        optionalString(section, "threshold", "scenario", "any-positive"));
    threshold.unit = thresholdUnitFromString(optionalString(section, "threshold", "unit", "lift"));

    if (threshold.scenario == ThresholdScenario::AnyPositive)
        threshold.value = optionalNumber(section, "threshold", "value", 0.0);
    else
        threshold.value = requireNumber(section, "threshold", "value");

    return threshold;
}

PriorDistribution ScenarioConfigurationReader::parsePrior(const Value& section)
{
    const PriorShape shape = priorShapeFromString(optionalString(section, "prior", "shape", "normal"));
    const double df = optionalNumber(section, "prior", "df", DEFAULT_STUDENT_T_DF);

    const bool hasLow = section.HasMember("intervalLow");
    const bool hasHigh = section.HasMember("intervalHigh");

    if (hasLow != hasHigh)
        throw ValidationException(hasLow ? "prior.intervalHigh" : "prior.intervalLow",
                                  "both interval bounds are required when either is given");

    if (!hasLow)
        return PriorDistribution::makeDefault(shape, df);

    return PriorDistribution::fromCredibleInterval(shape,
                                                   requireNumber(section, "prior", "intervalLow"),
                                                   requireNumber(section, "prior", "intervalHigh"),
                                                   df);
}

TestDesign ScenarioConfigurationReader::parseDesign(const Value& section)
{
    TestDesign design;
    design.testDurationDays = requireNumber(section, "design", "testDurationDays");
    design.dailyTraffic = requireNumber(section, "design", "dailyTraffic");
    design.variantFraction = optionalNumber(section, "design", "variantFraction", design.variantFraction);
    design.eligibilityFraction = optionalNumber(section, "design", "eligibilityFraction",
                                                design.eligibilityFraction);
    design.conversionLatencyDays = optionalNumber(section, "design", "conversionLatencyDays",
                                                  design.conversionLatencyDays);
    design.decisionLatencyDays = optionalNumber(section, "design", "decisionLatencyDays",
                                                design.decisionLatencyDays);
    design.validate();
    return design;
}

CostInputs ScenarioConfigurationReader::parseCosts(const Value& section)
{
    CostInputs costs;
    costs.fixedTestCost = optionalNumber(section, "costs", "fixedTestCost", 0.0);
    costs.laborHours = optionalNumber(section, "costs", "laborHours", 0.0);
    costs.laborHourlyRate = optionalNumber(section, "costs", "laborHourlyRate", 0.0);
    costs.dailyCostOfDelay = optionalNumber(section, "costs", "dailyCostOfDelay", 0.0);
    costs.validate();
    return costs;
}

MonteCarloOptions ScenarioConfigurationReader::parseSimulation(const Value& section)
{
    MonteCarloOptions simulation;

    if (section.HasMember("numSamples")) {
        const Value& samples = section["numSamples"];
        if (!samples.IsUint64() || samples.GetUint64() == 0)
            throw ValidationException("simulation.numSamples", "must be a positive integer");
        simulation.numSamples = static_cast<std::size_t>(samples.GetUint64());
    }

    if (section.HasMember("seed")) {
        const Value& seed = section["seed"];
        if (!seed.IsUint64())
            throw ValidationException("simulation.seed", "must be a non-negative integer");
        simulation.seed = seed.GetUint64();
    }

    return simulation;
}

const Value& ScenarioConfigurationReader::requireSection(const Value& root, const char* name)
{
    if (!root.HasMember(name))
        throw ValidationException(name, "section is missing");

    const Value& section = root[name];
    if (!section.IsObject())
        throw ValidationException(name, "section must be a JSON object");

    return section;
}

double ScenarioConfigurationReader::requireNumber(const Value& section,
                                                  const std::string& sectionName,
                                                  const char* key)
{
    const std::string path = sectionName + "." + key;

    if (!section.HasMember(key))
        throw ValidationException(path, "required field is missing");

    const Value& value = section[key];
    if (!value.IsNumber())
        throw ValidationException(path, "must be a number");

    return value.GetDouble();
}

double ScenarioConfigurationReader::optionalNumber(const Value& section,
                                                   const std::string& sectionName,
                                                   const char* key,
                                                   double defaultValue)
{
    if (!section.HasMember(key))
        return defaultValue;

    return requireNumber(section, sectionName, key);
}

std::string ScenarioConfigurationReader::optionalString(const Value& section,
                                                        const std::string& sectionName,
                                                        const char* key,
                                                        const std::string& defaultValue)
{
    if (!section.HasMember(key))
        return defaultValue;

    const Value& value = section[key];
    if (!value.IsString())
        throw ValidationException(sectionName + "." + key, "must be a string");

    return value.GetString();
}

} // namespace cli
} // namespace abvalue
