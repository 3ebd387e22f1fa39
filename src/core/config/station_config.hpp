#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace station::core::config {

    enum class Command {
        Run,
        List
    };

    // Validated operator input required to start a station run
    struct StationConfig {
        Command command = Command::Run;
        std::map<std::string, std::string> secret_overrides;
        std::optional<std::filesystem::path> secrets_file;
        std::string secret_env_prefix = "STATION_SECRET_";
        std::optional<std::filesystem::path> report_dir;
        std::optional<std::chrono::milliseconds> request_timeout;
        bool finalizer_affects_verdict = false;
        bool verbose = false;
    };

} // namespace station::core::config
