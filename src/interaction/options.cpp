#include "interaction/options.hpp"

#include <utility>

namespace station::interaction {

using core::errors::ErrorCategory;
using core::errors::StationError;
using protocol::InteractionKind;
using protocol::InteractionRequest;
using protocol::InteractionResponse;
using protocol::Option;

namespace {

StationError invalid_response(const InteractionRequest& request,
                              const std::string& detail) {
    return StationError{ErrorCategory::Infrastructure,
                        "Invalid response to " + protocol::to_string(request.kind) +
                            " request " + request.id + ": " + detail,
                        "invalid_response"};
}

// Index of the option carrying `value`, or -1. Values are unique per request.
int find_option(const std::vector<Option>& options, const nlohmann::json& value) {
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (options[i].value == value) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace

OptionSpec::OptionSpec(const char* label) : OptionSpec(std::string(label)) {}

OptionSpec::OptionSpec(std::string label) : name(std::move(label)), value(name) {}

OptionSpec::OptionSpec(std::string label, nlohmann::json option_value)
    : name(std::move(label)), value(std::move(option_value)) {}

std::vector<Option> normalize_options(const std::vector<OptionSpec>& specs) {
    std::vector<Option> options;
    options.reserve(specs.size());
    for (const auto& spec : specs) {
        options.push_back(Option{spec.name, spec.value});
    }
    return options;
}

std::vector<Option> pass_fail_options() {
    return {Option{"Pass", true}, Option{"Fail", false}};
}

core::errors::Result<InteractionResponse> resolve_response(
    const InteractionRequest& request, const nlohmann::json& selection) {
    InteractionResponse response;
    response.request_id = request.id;
    response.kind = request.kind;

    if (request.kind == InteractionKind::TextInput) {
        if (!selection.is_string()) {
            return invalid_response(request, "expected a string");
        }
        response.text = selection.get<std::string>();
        return response;
    }

    if (!protocol::takes_multiple(request)) {
        if (selection.is_array() || selection.is_object() || selection.is_null()) {
            return invalid_response(request, "expected exactly one value");
        }
        const int index = find_option(request.options, selection);
        if (index < 0) {
            return invalid_response(request, "unknown value " + selection.dump());
        }
        const Option& chosen = request.options[static_cast<std::size_t>(index)];
        if (request.kind == InteractionKind::Buttons ||
            request.kind == InteractionKind::PassFail) {
            response.value = chosen.value;
        } else {
            response.selection.push_back(chosen);
        }
        return response;
    }

    if (!selection.is_array()) {
        return invalid_response(request, "expected an array of values");
    }
    std::vector<bool> picked(request.options.size(), false);
    for (const auto& item : selection) {
        const int index = find_option(request.options, item);
        if (index < 0) {
            return invalid_response(request, "unknown value " + item.dump());
        }
        picked[static_cast<std::size_t>(index)] = true;
    }
    for (std::size_t i = 0; i < request.options.size(); ++i) {
        if (picked[i]) {
            response.selection.push_back(request.options[i]);
        }
    }
    return response;
}

}  // namespace station::interaction
