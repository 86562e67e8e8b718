#pragma once

#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "DecisionResults.h"
#include "ScenarioResults.h"

namespace abvalue {
namespace cli {

/**
 * @brief Exports results as JSON for downstream tooling.
 *
 * Keys use the result field names; the "evpi", "evsi" and "netValue"
 * sections appear only when the run produced them.
 */
class ResultSerializer {
public:
    static std::string exportToJson(const ScenarioResults& results);

    /**
     * @throws std::runtime_error if the file cannot be written
     */
    static void saveToFile(const ScenarioResults& results, const std::string& filePath);

private:
    using Allocator = rapidjson::Document::AllocatorType;

    static rapidjson::Value serializeEvpi(const EvpiResult& result, Allocator& allocator);
    static rapidjson::Value serializeEvsi(const EvsiResult& result, Allocator& allocator);
    static rapidjson::Value serializeNetValue(const NetValueResult& result, Allocator& allocator);
    static rapidjson::Value serializeSampleSizes(const SampleSizes& sizes, Allocator& allocator);
    static rapidjson::Value serializeWarnings(const std::vector<CalculationWarning>& warnings,
                                              Allocator& allocator);
    static rapidjson::Value makeString(const std::string& text, Allocator& allocator);
};

} // namespace cli
} // namespace abvalue
