#pragma once

#include <string>
#include <rapidjson/document.h>
#include "EvpiCalculator.h"
#include "EvsiCalculator.h"
#include "ExperimentInputs.h"
#include "NetValueCalculator.h"
#include "PriorDistribution.h"

namespace abvalue {
namespace cli {

/**
 * @brief Everything one A/B test scenario needs, as read from a JSON file.
 *
 * The threshold is kept in the user's units; thresholdLift() converts it
 * once the business inputs are known.
 */
class ScenarioConfiguration {
public:
    ScenarioConfiguration(const BusinessInputs& business,
                          const ThresholdSpec& threshold,
                          const PriorDistribution& prior,
                          const TestDesign& design,
                          const CostInputs& costs,
                          const MonteCarloOptions& simulation);

    const BusinessInputs& getBusiness() const { return mBusiness; }
    const ThresholdSpec& getThreshold() const { return mThreshold; }
    const PriorDistribution& getPrior() const { return mPrior; }
    const TestDesign& getDesign() const { return mDesign; }
    const CostInputs& getCosts() const { return mCosts; }
    const MonteCarloOptions& getSimulation() const { return mSimulation; }

    // Command-line overrides
    void setNumSamples(std::size_t numSamples);
    void setSeed(std::uint64_t seed);

    /**
     * @brief Threshold in decimal lift units.
     * @throws ValidationException if the threshold contradicts its scenario
     */
    double thresholdLift() const;

    EvpiInputs evpiInputs() const;
    EvsiInputs evsiInputs() const;
    NetValueInputs netValueInputs() const;

private:
    BusinessInputs mBusiness;
    ThresholdSpec mThreshold;
    PriorDistribution mPrior;
    TestDesign mDesign;
    CostInputs mCosts;
    MonteCarloOptions mSimulation;
};

/**
 * @brief Reads scenario files.
 *
 * Sections: business, threshold, prior, design, costs, simulation. A missing
 * or mistyped required field raises a ValidationException whose field name is
 * the JSON path, e.g. "design.dailyTraffic".
 */
class ScenarioConfigurationReader {
public:
    static ScenarioConfiguration readFromFile(const std::string& filePath);
    static ScenarioConfiguration readFromJson(const std::string& jsonText);

private:
    static ScenarioConfiguration parseDocument(const rapidjson::Document& doc);

    static BusinessInputs parseBusiness(const rapidjson::Value& section);
    static ThresholdSpec parseThreshold(const rapidjson::Value& section);
    static PriorDistribution parsePrior(const rapidjson::Value& section);
    static TestDesign parseDesign(const rapidjson::Value& section);
    static CostInputs parseCosts(const rapidjson::Value& section);
    static MonteCarloOptions parseSimulation(const rapidjson::Value& section);

    static const rapidjson::Value& requireSection(const rapidjson::Value& root, const char* name);
    static double requireNumber(const rapidjson::Value& section, const std::string& sectionName, const char* key);
    static double optionalNumber(const rapidjson::Value& section, const std::string& sectionName,
                                 const char* key, double defaultValue);
    static std::string optionalString(const rapidjson::Value& section, const std::string& sectionName,
                                      const char* key, const std::string& defaultValue);
};

} // namespace cli
} // namespace abvalue
