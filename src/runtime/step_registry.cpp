#include "runtime/step_registry.hpp"

#include <unordered_set>
#include <utility>

namespace station::runtime {

using core::errors::ErrorCategory;
using core::errors::StationError;

namespace {

StationError invalid_plan(const std::string& message) {
    return StationError{ErrorCategory::Input, message, "invalid_plan"};
}

}  // namespace

StepRegistry& StepRegistry::add(const StepMetadata& metadata, StepFactory factory) {
    steps_.push_back(StepSpec{metadata.resolve(), std::move(factory)});
    return *this;
}

StepRegistry& StepRegistry::finalizer(const StepMetadata& metadata,
                                      StepFactory factory) {
    finalizer_ = StepSpec{metadata.resolve(), std::move(factory)};
    return *this;
}

core::errors::Result<RunPlan> StepRegistry::build() const {
    std::unordered_set<std::string> seen;
    for (const auto& spec : steps_) {
        if (spec.info.identifier.empty()) {
            return invalid_plan("Step identifier cannot be empty.");
        }
        if (!spec.factory) {
            return invalid_plan("Step has no factory: " + spec.info.identifier);
        }
        if (!seen.insert(spec.info.identifier).second) {
            return invalid_plan("Duplicate step identifier: " + spec.info.identifier);
        }
    }
    if (finalizer_.has_value()) {
        if (finalizer_->info.identifier.empty()) {
            return invalid_plan("Finalizer identifier cannot be empty.");
        }
        if (!finalizer_->factory) {
            return invalid_plan("Finalizer has no factory: " + finalizer_->info.identifier);
        }
    }

    RunPlan plan;
    plan.steps = steps_;
    plan.finalizer = finalizer_;
    return plan;
}

}  // namespace station::runtime
