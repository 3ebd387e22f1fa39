#pragma once
#include "core/errors/station_errors.hpp"
#include "runtime/run_plan.hpp"

namespace station::app {

    // The demo acceptance run: one step per authoring feature, with a
    // Shutdown finalizer.
    core::errors::Result<runtime::RunPlan> build_demo_plan();

} // namespace station::app
