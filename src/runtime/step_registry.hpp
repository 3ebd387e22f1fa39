#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "core/errors/station_errors.hpp"
#include "runtime/run_plan.hpp"
#include "runtime/step.hpp"

namespace station::runtime {

// Typed replacement for a reflective list of step classes: each entry pairs a
// constructor with metadata resolved once, here.
class StepRegistry {
public:
    template <typename T>
    StepRegistry& add() {
        return add(T::metadata(), []() -> std::unique_ptr<Step> {
            return std::make_unique<T>();
        });
    }

    template <typename T>
    StepRegistry& finalizer() {
        return finalizer(T::metadata(), []() -> std::unique_ptr<Step> {
            return std::make_unique<T>();
        });
    }

    StepRegistry& add(const StepMetadata& metadata, StepFactory factory);
    StepRegistry& finalizer(const StepMetadata& metadata, StepFactory factory);

    // Rejects empty or duplicate identifiers and missing factories.
    core::errors::Result<RunPlan> build() const;

private:
    std::vector<StepSpec> steps_;
    std::optional<StepSpec> finalizer_;
};

}  // namespace station::runtime
