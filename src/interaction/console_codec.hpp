#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/station_errors.hpp"
#include "protocol/console_contract.hpp"

namespace station::interaction {

// JSON-lines wire format between the engine and an operator console.
nlohmann::json encode_message(const protocol::ConsoleMessage& message);

nlohmann::json step_info_to_json(const protocol::StepInfo& info);

core::errors::Result<protocol::InteractionResponseMessage> decode_response(
    const std::string& line);

}  // namespace station::interaction
