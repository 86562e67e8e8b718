#pragma once

#include <optional>
#include "DecisionResults.h"

namespace abvalue {
namespace cli {

// What one run produced; a mode fills only the results it asked for.
struct ScenarioResults {
    std::optional<EvpiResult> evpi;
    std::optional<EvsiResult> evsi;
    std::optional<NetValueResult> netValue;
};

} // namespace cli
} // namespace abvalue
