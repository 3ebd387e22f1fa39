#pragma once

#include <optional>
#include <string>
#include "core/errors/station_errors.hpp"
#include "interaction/interaction_channel.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/run_plan.hpp"
#include "session/run_state.hpp"
#include "session/secret_store.hpp"

namespace station::runtime {

struct SequencerOptions {
    // When set, a failing finalizer also fails an otherwise passing run.
    bool finalizer_affects_verdict = false;
};

// Drives one run: steps strictly in plan order on the calling thread, then
// the finalizer exactly once. Always produces a RunResult.
class Sequencer {
public:
    Sequencer(interaction::InteractionChannel& channel,
              const session::SecretStore& secrets, SequencerOptions options = {});

    protocol::RunResult execute(const std::string& run_id, const RunPlan& plan) const;

private:
    protocol::StepExecution run_step(
        const StepSpec& spec, session::RunState& state, bool is_finalizer,
        std::optional<core::errors::StationError>& infrastructure_error) const;

    interaction::InteractionChannel& channel_;
    const session::SecretStore& secrets_;
    SequencerOptions options_;
};

}  // namespace station::runtime
