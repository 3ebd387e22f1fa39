#include "runtime/sequencer.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include "core/logging/logger.hpp"
#include "runtime/step_context.hpp"

namespace station::runtime {

using core::errors::StationError;
using protocol::OutcomeKind;
using protocol::RunResult;
using protocol::RunVerdict;
using protocol::StepExecution;
using protocol::StopReason;

namespace {

StepExecution skipped_record(const StepSpec& spec) {
    StepExecution record;
    record.info = spec.info;
    record.outcome.kind = OutcomeKind::Skipped;
    return record;
}

std::string describe(const StepExecution& record) {
    std::string text = record.info.display_name + " -> " +
                       protocol::to_string(record.outcome.kind);
    if (!record.outcome.detail.empty()) {
        text += " (" + record.outcome.detail + ")";
    }
    return text;
}

}  // namespace

Sequencer::Sequencer(interaction::InteractionChannel& channel,
                     const session::SecretStore& secrets, SequencerOptions options)
    : channel_(channel), secrets_(secrets), options_(options) {}

StepExecution Sequencer::run_step(
    const StepSpec& spec, session::RunState& state, const bool is_finalizer,
    std::optional<StationError>& infrastructure_error) const {
    StepExecution record;
    record.info = spec.info;
    record.started_at = std::chrono::system_clock::now();
    static_cast<void>(
        channel_.publish(protocol::StepStartedMessage{record.info, is_finalizer}));
    STATION_LOG_INFO("Sequencer: start " + record.info.display_name);

    StepContext context(state, channel_, secrets_, record);
    try {
        std::unique_ptr<Step> step = spec.factory ? spec.factory() : nullptr;
        if (!step) {
            record.outcome = {OutcomeKind::Errored,
                              "No step could be constructed for " + spec.info.identifier};
        } else {
            auto ran = step->run(context);
            if (core::errors::is_error(ran)) {
                const auto& err = core::errors::get_error(ran);
                record.outcome = {OutcomeKind::Errored, err.message};
                if (core::errors::is_infrastructure(err) &&
                    !context.infrastructure_fault().has_value()) {
                    infrastructure_error = err;
                }
            } else {
                const auto& verdict = core::errors::get_value(ran);
                if (verdict.passed) {
                    record.outcome = {OutcomeKind::Passed, ""};
                } else {
                    record.outcome = {OutcomeKind::Failed, verdict.detail};
                }
            }
        }
    } catch (const std::exception& ex) {
        record.outcome = {OutcomeKind::Errored, ex.what()};
    } catch (...) {
        record.outcome = {OutcomeKind::Errored, "unknown exception"};
    }

    // Plumbing failures win over whatever the step concluded.
    if (context.infrastructure_fault().has_value()) {
        const auto& fault = context.infrastructure_fault().value();
        record.outcome = {OutcomeKind::Errored, fault.message};
        infrastructure_error = fault;
    }

    record.finished_at = std::chrono::system_clock::now();
    static_cast<void>(channel_.publish(
        protocol::StepFinishedMessage{record.info, record.outcome, is_finalizer}));
    if (protocol::is_failure(record.outcome.kind)) {
        STATION_LOG_WARN("Sequencer: " + describe(record));
    } else {
        STATION_LOG_INFO("Sequencer: " + describe(record));
    }
    return record;
}

RunResult Sequencer::execute(const std::string& run_id, const RunPlan& plan) const {
    RunResult result;
    result.run_id = run_id;
    result.started_at = std::chrono::system_clock::now();

    session::RunState state;
    STATION_LOG_INFO("Sequencer: run " + run_id + " started with " +
                     std::to_string(plan.steps.size()) + " steps");

    std::size_t next = 0;
    while (next < plan.steps.size()) {
        std::optional<StationError> infrastructure_error;
        StepExecution record =
            run_step(plan.steps[next], state, false, infrastructure_error);
        const bool failed = protocol::is_failure(record.outcome.kind);
        const bool stop_on_fail = record.info.stop_on_fail;
        result.steps.push_back(std::move(record));
        ++next;

        if (infrastructure_error.has_value()) {
            STATION_LOG_ERROR("Sequencer: infrastructure error [" +
                              infrastructure_error->code + "]: " +
                              infrastructure_error->message);
            result.infrastructure_error = infrastructure_error;
            result.stop_reason = StopReason::InfrastructureError;
            break;
        }
        if (failed && stop_on_fail) {
            result.stop_reason = StopReason::StepFailed;
            break;
        }
    }

    for (; next < plan.steps.size(); ++next) {
        STATION_LOG_DEBUG("Sequencer: skip " + plan.steps[next].info.display_name);
        result.steps.push_back(skipped_record(plan.steps[next]));
    }

    if (plan.finalizer.has_value()) {
        std::optional<StationError> finalizer_infrastructure;
        result.finalizer =
            run_step(plan.finalizer.value(), state, true, finalizer_infrastructure);
        if (finalizer_infrastructure.has_value() && !result.infrastructure_error.has_value()) {
            result.infrastructure_error = finalizer_infrastructure;
        }
    }

    bool any_failure = false;
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    for (const auto& record : result.steps) {
        if (record.outcome.kind == OutcomeKind::Skipped) {
            ++skipped;
        } else if (protocol::is_failure(record.outcome.kind)) {
            ++failed;
            any_failure = true;
        } else {
            ++passed;
        }
    }
    if (options_.finalizer_affects_verdict && result.finalizer.has_value() &&
        protocol::is_failure(result.finalizer->outcome.kind)) {
        any_failure = true;
    }
    result.verdict = any_failure ? RunVerdict::Failed : RunVerdict::Passed;

    result.summary = std::to_string(passed) + " passed, " + std::to_string(failed) +
                     " failed, " + std::to_string(skipped) + " skipped";
    if (result.finalizer.has_value()) {
        result.summary += "; finalizer " +
                          protocol::to_string(result.finalizer->outcome.kind);
    }
    result.finished_at = std::chrono::system_clock::now();
    STATION_LOG_INFO("Sequencer: run " + run_id + " finished: " +
                     protocol::to_string(result.verdict) + " (" + result.summary + ")");
    return result;
}

}  // namespace station::runtime
