#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/station_errors.hpp"

namespace station::protocol {

enum class LogStream {
    Out,
    Err
};

enum class OutcomeKind {
    Passed,
    Failed,
    Errored,
    Skipped
};

enum class RunVerdict {
    Passed,
    Failed
};

// Why the main loop ended.
enum class StopReason {
    Completed,
    StepFailed,
    InfrastructureError
};

struct LogLine {
    LogStream stream = LogStream::Out;
    std::string text;
    std::chrono::system_clock::time_point timestamp{};
};

struct StepLink {
    std::string url;
    std::optional<std::string> text;
};

// Static step metadata, resolved once at registration.
struct StepInfo {
    std::string identifier;
    std::string display_name;
    std::string description;
    std::optional<std::string> image;
    std::optional<StepLink> link;
    bool stop_on_fail = true;
};

struct StepOutcome {
    OutcomeKind kind = OutcomeKind::Passed;
    // Failure detail for Failed, cause for Errored.
    std::string detail;
};

struct StepExecution {
    StepInfo info;
    StepOutcome outcome;
    std::vector<LogLine> logs;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
};

struct RunResult {
    std::string run_id;
    RunVerdict verdict = RunVerdict::Passed;
    StopReason stop_reason = StopReason::Completed;
    std::vector<StepExecution> steps;
    std::optional<StepExecution> finalizer;
    std::optional<core::errors::StationError> infrastructure_error;
    std::string summary;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

inline bool is_failure(const OutcomeKind kind) {
    return kind == OutcomeKind::Failed || kind == OutcomeKind::Errored;
}

inline std::string to_string(const LogStream stream) {
    switch (stream) {
        case LogStream::Out:
            return "out";
        case LogStream::Err:
            return "err";
        default:
            return "unknown";
    }
}

inline std::string to_string(const OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Passed:
            return "passed";
        case OutcomeKind::Failed:
            return "failed";
        case OutcomeKind::Errored:
            return "errored";
        case OutcomeKind::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

inline std::string to_string(const RunVerdict verdict) {
    switch (verdict) {
        case RunVerdict::Passed:
            return "passed";
        case RunVerdict::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::string to_string(const StopReason reason) {
    switch (reason) {
        case StopReason::Completed:
            return "completed";
        case StopReason::StepFailed:
            return "step_failed";
        case StopReason::InfrastructureError:
            return "infrastructure_error";
        default:
            return "unknown";
    }
}

}  // namespace station::protocol
