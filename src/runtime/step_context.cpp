#include "runtime/step_context.hpp"

#include <chrono>
#include <utility>

namespace station::runtime {

using core::errors::StationError;
using protocol::InteractionKind;
using protocol::InteractionRequest;
using protocol::InteractionResponse;
using protocol::Option;

StepContext::StepContext(session::RunState& state,
                         interaction::InteractionChannel& channel,
                         const session::SecretStore& secrets,
                         protocol::StepExecution& record)
    : state_(state), channel_(channel), secrets_(secrets), record_(record) {}

session::RunState& StepContext::state() {
    return state_;
}

const protocol::StepInfo& StepContext::info() const {
    return record_.info;
}

void StepContext::log(const std::string& text) {
    log(protocol::LogStream::Out, text);
}

void StepContext::log_error(const std::string& text) {
    log(protocol::LogStream::Err, text);
}

void StepContext::log(const protocol::LogStream stream, const std::string& text) {
    record_.logs.push_back(
        protocol::LogLine{stream, text, std::chrono::system_clock::now()});
    // A closed console keeps the line in the record only.
    static_cast<void>(channel_.send_log(stream, text));
}

core::errors::Result<std::string> StepContext::get_secret(const std::string& name) {
    auto result = secrets_.get(name);
    if (core::errors::is_error(result)) {
        note_fault(core::errors::get_error(result));
    }
    return result;
}

void StepContext::note_fault(const StationError& error) {
    if (core::errors::is_infrastructure(error) && !infrastructure_fault_.has_value()) {
        infrastructure_fault_ = error;
    }
}

const std::optional<StationError>& StepContext::infrastructure_fault() const {
    return infrastructure_fault_;
}

core::errors::Result<InteractionResponse> StepContext::ask(InteractionRequest request) {
    auto response = channel_.request(std::move(request));
    if (core::errors::is_error(response)) {
        note_fault(core::errors::get_error(response));
    }
    return response;
}

core::errors::Result<nlohmann::json> StepContext::present_buttons(
    const std::vector<interaction::OptionSpec>& buttons, const std::string& prompt) {
    InteractionRequest request;
    request.kind = InteractionKind::Buttons;
    request.prompt = prompt;
    request.options = interaction::normalize_options(buttons);

    auto response = ask(std::move(request));
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return core::errors::get_value(response).value;
}

core::errors::Result<bool> StepContext::present_pass_fail_buttons(
    const std::string& prompt) {
    InteractionRequest request;
    request.kind = InteractionKind::PassFail;
    request.prompt = prompt;
    request.options = interaction::pass_fail_options();

    auto response = ask(std::move(request));
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return core::errors::get_value(response).value.get<bool>();
}

core::errors::Result<std::string> StepContext::present_text_input(
    const std::string& prompt, const int size) {
    InteractionRequest request;
    request.kind = InteractionKind::TextInput;
    request.prompt = prompt;
    request.size = size > 0 ? size : 50;

    auto response = ask(std::move(request));
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return core::errors::get_value(response).text;
}

core::errors::Result<Option> StepContext::present_radios(
    const std::string& prompt, const std::vector<interaction::OptionSpec>& options) {
    InteractionRequest request;
    request.kind = InteractionKind::Radios;
    request.prompt = prompt;
    request.options = interaction::normalize_options(options);

    auto response = ask(std::move(request));
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return core::errors::get_value(response).selection.front();
}

core::errors::Result<std::vector<Option>> StepContext::present_checkboxes(
    const std::string& prompt, const std::vector<interaction::OptionSpec>& options) {
    InteractionRequest request;
    request.kind = InteractionKind::Checkboxes;
    request.prompt = prompt;
    request.options = interaction::normalize_options(options);

    auto response = ask(std::move(request));
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return core::errors::get_value(response).selection;
}

core::errors::Result<Option> StepContext::present_select(
    const std::string& prompt, const std::vector<interaction::OptionSpec>& options) {
    InteractionRequest request;
    request.kind = InteractionKind::Select;
    request.prompt = prompt;
    request.options = interaction::normalize_options(options);
    request.allow_multiple = false;

    auto response = ask(std::move(request));
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return core::errors::get_value(response).selection.front();
}

core::errors::Result<std::vector<Option>> StepContext::present_multi_select(
    const std::string& prompt, const std::vector<interaction::OptionSpec>& options) {
    InteractionRequest request;
    request.kind = InteractionKind::Select;
    request.prompt = prompt;
    request.options = interaction::normalize_options(options);
    request.allow_multiple = true;

    auto response = ask(std::move(request));
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return core::errors::get_value(response).selection;
}

}  // namespace station::runtime
