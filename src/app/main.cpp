#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "app/demo_steps.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/station_errors.hpp"
#include "core/logging/logger.hpp"
#include "interaction/interaction_channel.hpp"
#include "interaction/stream_console.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/sequencer.hpp"
#include "session/run_report_writer.hpp"
#include "session/secret_store.hpp"

namespace {

int list_plan(const station::runtime::RunPlan& plan) {
    auto print = [](const station::protocol::StepInfo& info, const std::string& prefix) {
        std::cout << prefix << info.display_name;
        if (info.description != info.display_name) {
            std::cout << " - " << info.description;
        }
        if (!info.stop_on_fail) {
            std::cout << " [continues on failure]";
        }
        std::cout << "\n";
    };
    for (std::size_t i = 0; i < plan.steps.size(); ++i) {
        print(plan.steps[i].info, std::to_string(i + 1) + ". ");
    }
    if (plan.finalizer.has_value()) {
        print(plan.finalizer->info, "finalizer: ");
    }
    return 0;
}

std::shared_ptr<const station::session::SecretStore> make_secret_store(
    const station::core::config::StationConfig& config) {
    std::vector<std::shared_ptr<const station::session::SecretStore>> stores;
    stores.push_back(std::make_shared<station::session::OverrideSecretStore>(
        config.secret_overrides));
    if (config.secrets_file.has_value()) {
        stores.push_back(std::make_shared<station::session::JsonFileSecretStore>(
            config.secrets_file.value()));
    }
    stores.push_back(std::make_shared<station::session::EnvironmentSecretStore>(
        config.secret_env_prefix));
    return std::make_shared<station::session::ChainedSecretStore>(std::move(stores));
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string run_id = station::core::config::generate_run_id();
    station::core::logging::Logger::get().set_run_id(run_id);

    auto parsed = station::app::cli::parse_and_validate(argc, argv);
    if (station::core::errors::is_error(parsed)) {
        const auto& err = station::core::errors::get_error(parsed);
        STATION_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            STATION_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = station::core::errors::get_value(parsed);
    if (config.verbose) {
        station::core::logging::Logger::get().set_min_level(
            station::core::logging::LogLevel::DEBUG);
    }

    auto planned = station::app::build_demo_plan();
    if (station::core::errors::is_error(planned)) {
        const auto& err = station::core::errors::get_error(planned);
        STATION_LOG_ERROR("Invalid run plan [" + err.code + "]: " + err.message);
        return 2;
    }
    const auto& plan = station::core::errors::get_value(planned);

    if (config.command == station::core::config::Command::List) {
        return list_plan(plan);
    }

    std::optional<station::session::RunReportWriter> report_writer;
    if (config.report_dir.has_value()) {
        report_writer.emplace(config.report_dir.value());
        auto started = report_writer->write_started(run_id, plan.steps.size());
        if (station::core::errors::is_error(started)) {
            const auto& err = station::core::errors::get_error(started);
            STATION_LOG_ERROR("Failed to write report [" + err.code + "]: " + err.message);
            return 6;
        }
    }

    station::interaction::ChannelOptions channel_options;
    channel_options.default_timeout = config.request_timeout;
    station::interaction::InteractionChannel channel(channel_options);
    station::interaction::StreamConsole console(channel, STDIN_FILENO, std::cout);
    console.start();

    const auto secrets = make_secret_store(config);
    station::runtime::SequencerOptions options;
    options.finalizer_affects_verdict = config.finalizer_affects_verdict;
    station::runtime::Sequencer sequencer(channel, *secrets, options);

    STATION_LOG_INFO("Run started: " + run_id);
    const auto result = sequencer.execute(run_id, plan);

    console.stop();
    channel.close("run finished");

    auto final_message = station::session::run_result_to_json(result);
    final_message["type"] = "run_result";
    std::cout << final_message.dump() << std::endl;

    for (const auto& record : result.steps) {
        STATION_LOG_INFO("Step " + record.info.display_name + ": " +
                         station::protocol::to_string(record.outcome.kind));
    }
    if (result.finalizer.has_value()) {
        STATION_LOG_INFO("Finalizer " + result.finalizer->info.display_name + ": " +
                         station::protocol::to_string(result.finalizer->outcome.kind));
    }
    STATION_LOG_INFO("Run summary: " + result.summary);

    if (report_writer.has_value()) {
        auto written = report_writer->write_result(result);
        if (station::core::errors::is_error(written)) {
            const auto& err = station::core::errors::get_error(written);
            STATION_LOG_ERROR("Failed to write report [" + err.code + "]: " + err.message);
            return 6;
        }
        STATION_LOG_INFO("Report: " + station::core::errors::get_value(written).string());
    }

    if (result.stop_reason == station::protocol::StopReason::InfrastructureError) {
        return 3;
    }
    return result.verdict == station::protocol::RunVerdict::Passed ? 0 : 1;
}
