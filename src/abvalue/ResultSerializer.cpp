#include "ResultSerializer.h"
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace abvalue {
namespace cli {

std::string ResultSerializer::exportToJson(const ScenarioResults& results)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    if (results.evpi)
        doc.AddMember("evpi", serializeEvpi(*results.evpi, allocator), allocator);
    if (results.evsi)
        doc.AddMember("evsi", serializeEvsi(*results.evsi, allocator), allocator);
    if (results.netValue)
        doc.AddMember("netValue", serializeNetValue(*results.netValue, allocator), allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

void ResultSerializer::saveToFile(const ScenarioResults& results, const std::string& filePath)
{
    const std::string jsonStr = exportToJson(results);

    std::ofstream file(filePath);
    if (!file.is_open())
        throw std::runtime_error("Cannot open file for writing: " + filePath);

    file << jsonStr << "\n";
    if (!file)
        throw std::runtime_error("Failed writing results to " + filePath);
}

Value ResultSerializer::serializeEvpi(const EvpiResult& result, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("evpiDollars", result.evpiDollars, allocator);
    obj.AddMember("defaultDecision", makeString(decisionToString(result.defaultDecision), allocator), allocator);
    obj.AddMember("K", result.K, allocator);
    obj.AddMember("thresholdLift", result.thresholdLift, allocator);
    obj.AddMember("thresholdDollars", result.thresholdDollars, allocator);
    obj.AddMember("priorMean", result.priorMean, allocator);
    obj.AddMember("probabilityClearsThreshold", result.probabilityClearsThreshold, allocator);
    obj.AddMember("chanceOfBeingWrong", result.chanceOfBeingWrong, allocator);

    if (result.normalDiagnostics) {
        Value diagnostics(kObjectType);
        diagnostics.AddMember("zScore", result.normalDiagnostics->zScore, allocator);
        diagnostics.AddMember("phiZ", result.normalDiagnostics->phiZ, allocator);
        diagnostics.AddMember("PhiZ", result.normalDiagnostics->PhiZ, allocator);
        obj.AddMember("normalDiagnostics", diagnostics, allocator);
    }

    Value edgeCases(kObjectType);
    edgeCases.AddMember("nearZeroSigma", result.edgeCases.nearZeroSigma, allocator);
    edgeCases.AddMember("priorOneSided", result.edgeCases.priorOneSided, allocator);
    obj.AddMember("edgeCases", edgeCases, allocator);

    obj.AddMember("truncationSignificant", result.truncationSignificant, allocator);
    return obj;
}

Value ResultSerializer::serializeEvsi(const EvsiResult& result, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("evsiDollars", result.evsiDollars, allocator);
    obj.AddMember("evpiDollars", result.evpiDollars, allocator);
    obj.AddMember("fractionOfEvpi", result.fractionOfEvpi, allocator);
    obj.AddMember("defaultDecision", makeString(decisionToString(result.defaultDecision), allocator), allocator);
    obj.AddMember("probabilityClearsThreshold", result.probabilityClearsThreshold, allocator);
    obj.AddMember("probabilityTestChangesDecision", result.probabilityTestChangesDecision, allocator);
    obj.AddMember("method", makeString(evsiMethodToString(result.method), allocator), allocator);
    obj.AddMember("sampleSizes", serializeSampleSizes(result.sampleSizes, allocator), allocator);
    obj.AddMember("liftStandardError", result.liftStandardError, allocator);

    if (result.monteCarloStandardError) {
        obj.AddMember("monteCarloStandardError", *result.monteCarloStandardError, allocator);
        obj.AddMember("numSamples", static_cast<std::uint64_t>(result.numSamples), allocator);
        obj.AddMember("numRejected", static_cast<std::uint64_t>(result.numRejected), allocator);
    }

    obj.AddMember("truncationSignificant", result.truncationSignificant, allocator);
    obj.AddMember("warnings", serializeWarnings(result.warnings, allocator), allocator);
    return obj;
}

Value ResultSerializer::serializeNetValue(const NetValueResult& result, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("netValueDollars", result.netValueDollars, allocator);
    obj.AddMember("verdict", makeString(testVerdictToString(result.verdict), allocator), allocator);
    obj.AddMember("defaultDecision", makeString(decisionToString(result.defaultDecision), allocator), allocator);
    obj.AddMember("avgValueDuringTest", result.avgValueDuringTest, allocator);
    obj.AddMember("avgValueAfterDecision", result.avgValueAfterDecision, allocator);
    obj.AddMember("avgValueWithTest", result.avgValueWithTest, allocator);
    obj.AddMember("avgValueWithoutTest", result.avgValueWithoutTest, allocator);
    obj.AddMember("grossValueDollars", result.grossValueDollars, allocator);

    Value costs(kObjectType);
    costs.AddMember("fixed", result.fixedCostDollars, allocator);
    costs.AddMember("labor", result.laborCostDollars, allocator);
    costs.AddMember("delay", result.delayCostDollars, allocator);
    costs.AddMember("total", result.totalCostDollars, allocator);
    obj.AddMember("costs", costs, allocator);

    Value cod(kObjectType);
    cod.AddMember("applies", result.costOfDelay.applies, allocator);
    cod.AddMember("codDollars", result.costOfDelay.codDollars, allocator);
    cod.AddMember("dailyOpportunityCost", result.costOfDelay.dailyOpportunityCost, allocator);
    cod.AddMember("duringTestDollars", result.costOfDelay.duringTestDollars, allocator);
    cod.AddMember("duringLatencyDollars", result.costOfDelay.duringLatencyDollars, allocator);
    obj.AddMember("costOfDelay", cod, allocator);

    obj.AddMember("probabilityTestChangesDecision", result.probabilityTestChangesDecision, allocator);
    obj.AddMember("monteCarloStandardError", result.monteCarloStandardError, allocator);
    obj.AddMember("sampleSizes", serializeSampleSizes(result.sampleSizes, allocator), allocator);
    obj.AddMember("numSamples", static_cast<std::uint64_t>(result.numSamples), allocator);
    obj.AddMember("numRejected", static_cast<std::uint64_t>(result.numRejected), allocator);
    obj.AddMember("truncationSignificant", result.truncationSignificant, allocator);
    obj.AddMember("warnings", serializeWarnings(result.warnings, allocator), allocator);
    return obj;
}

Value ResultSerializer::serializeSampleSizes(const SampleSizes& sizes, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("total", static_cast<std::int64_t>(sizes.total), allocator);
    obj.AddMember("control", static_cast<std::int64_t>(sizes.control), allocator);
    obj.AddMember("variant", static_cast<std::int64_t>(sizes.variant), allocator);
    return obj;
}

Value ResultSerializer::serializeWarnings(const std::vector<CalculationWarning>& warnings, Allocator& allocator)
{
    Value array(kArrayType);
    for (const auto& w : warnings) {
        Value entry(kObjectType);
        entry.AddMember("code", makeString(w.code, allocator), allocator);
        entry.AddMember("message", makeString(w.message, allocator), allocator);
        array.PushBack(entry, allocator);
    }
    return array;
}

Value ResultSerializer::makeString(const std::string& text, Allocator& allocator)
{
    return Value(text.c_str(), static_cast<SizeType>(text.size()), allocator);
}

} // namespace cli
} // namespace abvalue
