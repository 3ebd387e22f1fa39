#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "protocol/run_execution_contract.hpp"
#include "runtime/step.hpp"

namespace station::runtime {

using StepFactory = std::function<std::unique_ptr<Step>()>;

struct StepSpec {
    protocol::StepInfo info;
    StepFactory factory;
};

// Ordered steps plus an optional finalizer. Treated as immutable once a run
// starts.
struct RunPlan {
    std::vector<StepSpec> steps;
    std::optional<StepSpec> finalizer;
};

}  // namespace station::runtime
