#include "interaction/console_codec.hpp"

#include <type_traits>

namespace station::interaction {

using core::errors::ErrorCategory;
using core::errors::StationError;
using nlohmann::json;

namespace {

json options_to_json(const std::vector<protocol::Option>& options) {
    json out = json::array();
    for (const auto& option : options) {
        out.push_back(json{{"name", option.name}, {"value", option.value}});
    }
    return out;
}

StationError invalid_message(const std::string& detail) {
    return StationError{ErrorCategory::Input, "Invalid console message: " + detail,
                        "invalid_message"};
}

}  // namespace

json step_info_to_json(const protocol::StepInfo& info) {
    json payload;
    payload["identifier"] = info.identifier;
    payload["display_name"] = info.display_name;
    payload["description"] = info.description;
    payload["image"] = info.image.has_value() ? json(info.image.value()) : json(nullptr);
    if (info.link.has_value()) {
        payload["link"] = json{{"url", info.link->url},
                               {"text", info.link->text.has_value()
                                            ? json(info.link->text.value())
                                            : json(nullptr)}};
    } else {
        payload["link"] = nullptr;
    }
    payload["stop_on_fail"] = info.stop_on_fail;
    return payload;
}

json encode_message(const protocol::ConsoleMessage& message) {
    return std::visit(
        [](const auto& msg) -> json {
            using T = std::decay_t<decltype(msg)>;
            json out;
            if constexpr (std::is_same_v<T, protocol::LogMessage>) {
                out["type"] = "log";
                out["stream"] = protocol::to_string(msg.stream);
                out["text"] = msg.text;
            } else if constexpr (std::is_same_v<T, protocol::InteractionRequestMessage>) {
                out["type"] = "interaction_request";
                out["id"] = msg.request.id;
                out["kind"] = protocol::to_string(msg.request.kind);
                out["prompt"] = msg.request.prompt;
                out["options"] = options_to_json(msg.request.options);
                out["allow_multiple"] = protocol::takes_multiple(msg.request);
                if (msg.request.kind == protocol::InteractionKind::TextInput) {
                    out["size"] = msg.request.size;
                }
            } else if constexpr (std::is_same_v<T, protocol::InteractionWithdrawnMessage>) {
                out["type"] = "interaction_withdrawn";
                out["id"] = msg.request_id;
                out["reason"] = msg.reason;
            } else if constexpr (std::is_same_v<T, protocol::StepStartedMessage>) {
                out["type"] = "step_started";
                out["step"] = step_info_to_json(msg.info);
                out["finalizer"] = msg.finalizer;
            } else {
                out["type"] = "step_finished";
                out["step"] = step_info_to_json(msg.info);
                out["finalizer"] = msg.finalizer;
                out["outcome"] = protocol::to_string(msg.outcome.kind);
                out["detail"] = msg.outcome.detail;
            }
            return out;
        },
        message);
}

core::errors::Result<protocol::InteractionResponseMessage> decode_response(
    const std::string& line) {
    const json document = json::parse(line, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return invalid_message("not a JSON object");
    }

    auto type = document.find("type");
    if (type == document.end() || !type->is_string() ||
        type->get<std::string>() != "interaction_response") {
        return invalid_message("expected type interaction_response");
    }

    auto id = document.find("id");
    if (id == document.end() || !id->is_string() || id->get<std::string>().empty()) {
        return invalid_message("missing request id");
    }

    auto selection = document.find("selection");
    if (selection == document.end()) {
        return invalid_message("missing selection");
    }

    return protocol::InteractionResponseMessage{id->get<std::string>(), *selection};
}

}  // namespace station::interaction
