#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/station_errors.hpp"
#include "interaction/interaction_channel.hpp"
#include "interaction/options.hpp"
#include "protocol/interaction_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "session/run_state.hpp"
#include "session/secret_store.hpp"

namespace station::runtime {

// Everything a step may touch while it runs. Log lines are captured into the
// step's own record and forwarded to the operator console.
class StepContext {
public:
    StepContext(session::RunState& state, interaction::InteractionChannel& channel,
                const session::SecretStore& secrets, protocol::StepExecution& record);

    session::RunState& state();
    const protocol::StepInfo& info() const;

    void log(const std::string& text);
    void log_error(const std::string& text);
    void log(protocol::LogStream stream, const std::string& text);

    core::errors::Result<std::string> get_secret(const std::string& name);

    // Returns the value of the clicked button.
    core::errors::Result<nlohmann::json> present_buttons(
        const std::vector<interaction::OptionSpec>& buttons,
        const std::string& prompt = "");
    // true for "Pass", false for "Fail".
    core::errors::Result<bool> present_pass_fail_buttons(const std::string& prompt = "");
    core::errors::Result<std::string> present_text_input(const std::string& prompt,
                                                         int size = 50);
    core::errors::Result<protocol::Option> present_radios(
        const std::string& prompt, const std::vector<interaction::OptionSpec>& options);
    core::errors::Result<std::vector<protocol::Option>> present_checkboxes(
        const std::string& prompt, const std::vector<interaction::OptionSpec>& options);
    core::errors::Result<protocol::Option> present_select(
        const std::string& prompt, const std::vector<interaction::OptionSpec>& options);
    core::errors::Result<std::vector<protocol::Option>> present_multi_select(
        const std::string& prompt, const std::vector<interaction::OptionSpec>& options);

    // First infrastructure failure seen through this context. Once set, the
    // run is aborted no matter what the step returns.
    const std::optional<core::errors::StationError>& infrastructure_fault() const;

private:
    core::errors::Result<protocol::InteractionResponse> ask(
        protocol::InteractionRequest request);
    void note_fault(const core::errors::StationError& error);

    session::RunState& state_;
    interaction::InteractionChannel& channel_;
    const session::SecretStore& secrets_;
    protocol::StepExecution& record_;
    std::optional<core::errors::StationError> infrastructure_fault_;
};

}  // namespace station::runtime
