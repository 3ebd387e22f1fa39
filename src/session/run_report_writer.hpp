#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/station_errors.hpp"
#include "protocol/run_execution_contract.hpp"

namespace station::session {

nlohmann::json step_execution_to_json(const protocol::StepExecution& record);
nlohmann::json run_result_to_json(const protocol::RunResult& result);

// Appends one JSON event per line to <report_dir>/<run_id>.jsonl.
class RunReportWriter {
public:
    explicit RunReportWriter(std::filesystem::path report_dir);

    core::errors::Result<std::filesystem::path> write_started(
        const std::string& run_id, std::size_t step_count) const;

    // Writes every step record, the finalizer record and the final verdict.
    core::errors::Result<std::filesystem::path> write_result(
        const protocol::RunResult& result) const;

    core::errors::Result<std::filesystem::path> report_path(
        const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path report_dir_;
};

}  // namespace station::session
