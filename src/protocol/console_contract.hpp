#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "interaction_contract.hpp"
#include "run_execution_contract.hpp"

namespace station::protocol {

    // Engine -> console messages
    struct LogMessage { LogStream stream; std::string text; };
    struct InteractionRequestMessage { InteractionRequest request; };
    struct InteractionWithdrawnMessage { std::string request_id; std::string reason; };
    struct StepStartedMessage { StepInfo info; bool finalizer = false; };
    struct StepFinishedMessage { StepInfo info; StepOutcome outcome; bool finalizer = false; };

    // Everything the console must render, in the order the engine produced it.
    using ConsoleMessage = std::variant<
        LogMessage,
        InteractionRequestMessage,
        InteractionWithdrawnMessage,
        StepStartedMessage,
        StepFinishedMessage
    >;

    // Console -> engine
    struct InteractionResponseMessage {
        std::string request_id;
        nlohmann::json selection;
    };

} // namespace station::protocol
