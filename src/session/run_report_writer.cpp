#include "session/run_report_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <utility>
#include "interaction/console_codec.hpp"

namespace station::session {

using core::errors::ErrorCategory;
using core::errors::StationError;
using nlohmann::json;

namespace {

std::int64_t to_unix_ms(const std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::int64_t now_unix_ms() {
    return to_unix_ms(std::chrono::system_clock::now());
}

json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp.has_value() ? json(to_unix_ms(tp.value())) : json(nullptr);
}

json make_event(const std::string& name, const std::string& run_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = name;
    event["run_id"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

json step_execution_to_json(const protocol::StepExecution& record) {
    json payload = interaction::step_info_to_json(record.info);
    payload["outcome"] = protocol::to_string(record.outcome.kind);
    payload["detail"] = record.outcome.detail;
    payload["started_unix_ms"] = optional_time(record.started_at);
    payload["finished_unix_ms"] = optional_time(record.finished_at);

    json logs = json::array();
    for (const auto& line : record.logs) {
        logs.push_back(json{{"stream", protocol::to_string(line.stream)},
                            {"text", line.text},
                            {"ts_unix_ms", to_unix_ms(line.timestamp)}});
    }
    payload["logs"] = std::move(logs);
    return payload;
}

json run_result_to_json(const protocol::RunResult& result) {
    json payload;
    payload["run_id"] = result.run_id;
    payload["verdict"] = protocol::to_string(result.verdict);
    payload["stop_reason"] = protocol::to_string(result.stop_reason);
    payload["summary"] = result.summary;
    payload["started_unix_ms"] = to_unix_ms(result.started_at);
    payload["finished_unix_ms"] = to_unix_ms(result.finished_at);
    if (result.infrastructure_error.has_value()) {
        payload["infrastructure_error"] =
            json{{"code", result.infrastructure_error->code},
                 {"message", result.infrastructure_error->message}};
    } else {
        payload["infrastructure_error"] = nullptr;
    }

    json steps = json::array();
    for (const auto& record : result.steps) {
        steps.push_back(step_execution_to_json(record));
    }
    payload["steps"] = std::move(steps);
    payload["finalizer"] = result.finalizer.has_value()
                               ? step_execution_to_json(result.finalizer.value())
                               : json(nullptr);
    return payload;
}

RunReportWriter::RunReportWriter(std::filesystem::path report_dir)
    : report_dir_(std::move(report_dir)) {}

core::errors::Result<std::filesystem::path> RunReportWriter::report_path(
    const std::string& run_id) const {
    if (run_id.empty()) {
        return StationError{ErrorCategory::Input, "Run ID cannot be empty.",
                            "invalid_run_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(report_dir_, ec);
    if (ec) {
        return StationError{ErrorCategory::Internal,
                            "Unable to create report directory: " +
                                report_dir_.string(),
                            "report_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(report_dir_, ec) || ec) {
        return StationError{ErrorCategory::Input,
                            "Report path is not a directory: " + report_dir_.string(),
                            "invalid_report_dir"};
    }

    return report_dir_ / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> RunReportWriter::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto path_result = report_path(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return StationError{ErrorCategory::Internal,
                            "Unable to open report file: " + path.string(),
                            "report_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return StationError{ErrorCategory::Internal,
                            "Unable to write report event: " + path.string(),
                            "report_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> RunReportWriter::write_started(
    const std::string& run_id, const std::size_t step_count) const {
    json payload;
    payload["step_count"] = step_count;
    return append_event(run_id, make_event("run_started", run_id, payload).dump());
}

core::errors::Result<std::filesystem::path> RunReportWriter::write_result(
    const protocol::RunResult& result) const {
    for (const auto& record : result.steps) {
        auto written = append_event(
            result.run_id,
            make_event("step", result.run_id, step_execution_to_json(record)).dump());
        if (core::errors::is_error(written)) {
            return written;
        }
    }
    if (result.finalizer.has_value()) {
        auto written = append_event(
            result.run_id,
            make_event("finalizer", result.run_id,
                       step_execution_to_json(result.finalizer.value()))
                .dump());
        if (core::errors::is_error(written)) {
            return written;
        }
    }

    json payload = run_result_to_json(result);
    payload.erase("steps");
    payload.erase("finalizer");
    return append_event(result.run_id,
                        make_event("run_finished", result.run_id, payload).dump());
}

}  // namespace station::session
