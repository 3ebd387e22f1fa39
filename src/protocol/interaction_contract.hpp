#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace station::protocol {

    enum class InteractionKind {
        Buttons,
        PassFail,
        TextInput,
        Radios,
        Checkboxes,
        Select
    };

    // A normalized choice as the console sees it.
    struct Option {
        std::string name;
        nlohmann::json value;
    };

    inline bool operator==(const Option& lhs, const Option& rhs) {
        return lhs.name == rhs.name && lhs.value == rhs.value;
    }

    struct InteractionRequest {
        std::string id;  // Assigned by the channel when the request is issued
        InteractionKind kind = InteractionKind::Buttons;
        std::string prompt;
        std::vector<Option> options;
        bool allow_multiple = false;  // Select only
        int size = 50;                // TextInput width hint, in characters
    };

    // Exactly one member is meaningful, depending on `kind`:
    //   Buttons / PassFail          -> value
    //   TextInput                   -> text
    //   Radios / Select(single)     -> selection (one entry)
    //   Checkboxes / Select(multi)  -> selection (ordered, duplicate-free)
    struct InteractionResponse {
        std::string request_id;
        InteractionKind kind = InteractionKind::Buttons;
        nlohmann::json value;
        std::string text;
        std::vector<Option> selection;
    };

    inline bool takes_options(const InteractionKind kind) {
        return kind != InteractionKind::TextInput;
    }

    inline bool takes_multiple(const InteractionRequest& request) {
        return request.kind == InteractionKind::Checkboxes ||
               (request.kind == InteractionKind::Select && request.allow_multiple);
    }

    inline std::string to_string(const InteractionKind kind) {
        switch (kind) {
            case InteractionKind::Buttons:    return "buttons";
            case InteractionKind::PassFail:   return "pass_fail";
            case InteractionKind::TextInput:  return "text_input";
            case InteractionKind::Radios:     return "radios";
            case InteractionKind::Checkboxes: return "checkboxes";
            case InteractionKind::Select:     return "select";
            default: return "unknown";
        }
    }

} // namespace station::protocol
