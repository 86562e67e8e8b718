#include <cstdint>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <boost/program_options.hpp>
#include "DecisionComputeService.h"
#include "DecisionException.h"
#include "OutputUtils.h"
#include "ReportWriter.h"
#include "ResultSerializer.h"
#include "ScenarioConfiguration.h"
#include "ScenarioResults.h"

namespace po = boost::program_options;

using namespace abvalue;
using namespace abvalue::cli;
using abvalue::concurrency::ComputeResponse;
using abvalue::concurrency::DecisionComputeService;

namespace {

const int EXIT_VALIDATION_ERROR = 2;
const int EXIT_NUMERICAL_ERROR = 3;

enum class RunMode { Evpi, Evsi, NetValue, All };

RunMode parseRunMode(const std::string& name)
{
    if (name == "evpi")
        return RunMode::Evpi;
    if (name == "evsi")
        return RunMode::Evsi;
    if (name == "netvalue")
        return RunMode::NetValue;
    if (name == "all")
        return RunMode::All;

    throw ValidationException("mode", "expected evpi, evsi, netvalue or all, got '" + name + "'");
}

void printUsage(const po::options_description& desc)
{
    std::cout << "abvalue - value of information for A/B test decisions\n\n";
    std::cout << "Usage: abvalue --scenario <file> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Is it worth knowing the true lift?\n";
    std::cout << "  abvalue --scenario checkout.json --mode evpi\n\n";
    std::cout << "  # Full analysis, reproducible, mirrored to a log file\n";
    std::cout << "  abvalue --scenario checkout.json --seed 42 --log-file checkout.log\n\n";
    std::cout << "  # More Monte Carlo samples and a JSON export\n";
    std::cout << "  abvalue --scenario checkout.json --mode netvalue --samples 50000 --json-out result.json\n";
}

// Unwraps a background response, turning a failure back into an exception.
template <class R>
R takeResult(std::future<ComputeResponse<R>>& future)
{
    ComputeResponse<R> response = future.get();
    if (!response.ok()) {
        if (response.failureKind() == concurrency::ComputeFailureKind::Numerical)
            throw NumericalException(response.message());
        throw std::runtime_error(response.message());
    }
    return response.result();
}

ScenarioResults runScenario(const ScenarioConfiguration& scenario, RunMode mode)
{
    DecisionComputeService service;
    ScenarioResults results;

    const bool wantEvpi = mode == RunMode::Evpi || mode == RunMode::All;
    const bool wantEvsi = mode == RunMode::Evsi || mode == RunMode::All;
    const bool wantNetValue = mode == RunMode::NetValue || mode == RunMode::All;

    // Validate and dispatch everything before blocking on any result.
    std::optional<std::future<ComputeResponse<EvsiResult>>> evsi;
    std::optional<std::future<ComputeResponse<NetValueResult>>> netValue;

    if (wantEvsi)
        evsi = service.submitEvsi(scenario.evsiInputs(), scenario.getSimulation());
    if (wantNetValue)
        netValue = service.submitNetValue(scenario.netValueInputs(), scenario.getSimulation());

    if (wantEvpi)
        results.evpi = service.computeEvpi(scenario.evpiInputs());
    if (evsi)
        results.evsi = takeResult(*evsi);
    if (netValue)
        results.netValue = takeResult(*netValue);

    return results;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("scenario,s", po::value<std::string>(), "Scenario file (JSON)")
            ("mode,m", po::value<std::string>()->default_value("all"), "What to compute: evpi, evsi, netvalue or all")
            ("samples,n", po::value<std::size_t>(), "Monte Carlo samples (overrides simulation.numSamples)")
            ("seed", po::value<std::uint64_t>(), "Random seed for reproducible Monte Carlo runs")
            ("log-file,l", po::value<std::string>(), "Also write the report to this file")
            ("json-out,j", po::value<std::string>(), "Write the results as JSON to this file");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        if (!vm.count("scenario")) {
            std::cerr << "Error: --scenario is required\n\n";
            printUsage(desc);
            return 1;
        }

        const RunMode mode = parseRunMode(vm["mode"].as<std::string>());

        ScenarioConfiguration scenario =
            ScenarioConfigurationReader::readFromFile(vm["scenario"].as<std::string>());

        if (vm.count("samples"))
            scenario.setNumSamples(vm["samples"].as<std::size_t>());
        if (vm.count("seed"))
            scenario.setSeed(vm["seed"].as<std::uint64_t>());

        std::unique_ptr<ReportOutput> output;
        if (vm.count("log-file"))
            output = std::make_unique<ReportOutput>(std::cout, vm["log-file"].as<std::string>());
        else
            output = std::make_unique<ReportOutput>(std::cout);

        const ScenarioResults results = runScenario(scenario, mode);

        ReportWriter writer(output->stream());
        writer.writeAll(scenario, results);

        if (vm.count("json-out")) {
            const std::string jsonPath = vm["json-out"].as<std::string>();
            ResultSerializer::saveToFile(results, jsonPath);
            output->stream() << "\nResults written to " << jsonPath << std::endl;
        }
    }
    catch (const ValidationException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_VALIDATION_ERROR;
    }
    catch (const NumericalException& e) {
        std::cerr << "Error: numerical failure: " << e.what() << std::endl;
        return EXIT_NUMERICAL_ERROR;
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
