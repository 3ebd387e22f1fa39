#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/station_errors.hpp"
#include "protocol/interaction_contract.hpp"

namespace station::interaction {

// What a step author writes: either a bare label (value == label) or an
// explicit (label, value) pair. Implicit on purpose so option lists read as
// {"Button 1", "Button 2"} or {{"Green", true}, {"Other", 42}}.
struct OptionSpec {
    OptionSpec(const char* label);
    OptionSpec(std::string label);
    OptionSpec(std::string label, nlohmann::json value);

    std::string name;
    nlohmann::json value;
};

std::vector<protocol::Option> normalize_options(const std::vector<OptionSpec>& specs);

std::vector<protocol::Option> pass_fail_options();

// Checks a console selection against the request that produced it and turns
// it into a typed response. Any mismatch is an `invalid_response`
// infrastructure error.
core::errors::Result<protocol::InteractionResponse> resolve_response(
    const protocol::InteractionRequest& request, const nlohmann::json& selection);

}  // namespace station::interaction
