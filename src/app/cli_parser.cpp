#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace station::app::cli {

    using namespace station::core::errors;
    using station::core::config::Command;
    using station::core::config::StationConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> secrets;
        std::optional<std::string> secrets_file;
        std::optional<std::string> report_dir;
        std::optional<std::string> timeout_ms;
        bool finalizer_affects_verdict = false;
        bool verbose = false;
    };

    Result<StationConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return StationError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: station run [--secret NAME=VALUE]..."};
        }

        StationConfig config;
        std::string command = argv[1];
        if (command == "run") {
            config.command = Command::Run;
        } else if (command == "list") {
            config.command = Command::List;
        } else {
            return StationError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'run' and 'list'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--secret") {
                if (i + 1 < args.size()) raw.secrets.push_back(args[++i]);
                else return StationError{ErrorCategory::Input, "Missing value for --secret", "missing_value"};
            } else if (args[i] == "--secrets-file") {
                if (i + 1 < args.size()) raw.secrets_file = args[++i];
                else return StationError{ErrorCategory::Input, "Missing value for --secrets-file", "missing_value"};
            } else if (args[i] == "--report-dir") {
                if (i + 1 < args.size()) raw.report_dir = args[++i];
                else return StationError{ErrorCategory::Input, "Missing value for --report-dir", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return StationError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--finalizer-affects-verdict") {
                raw.finalizer_affects_verdict = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return StationError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        config.verbose = raw.verbose;
        config.finalizer_affects_verdict = raw.finalizer_affects_verdict;

        for (const auto& secret : raw.secrets) {
            const auto eq = secret.find('=');
            if (eq == std::string::npos || eq == 0) {
                return StationError{ErrorCategory::Input, "Invalid --secret value: " + secret, "invalid_secret", "Use --secret NAME=VALUE."};
            }
            const std::string name = secret.substr(0, eq);
            if (config.secret_overrides.count(name) > 0) {
                return StationError{ErrorCategory::Input, "Secret given more than once: " + name, "duplicate_secret"};
            }
            config.secret_overrides.emplace(name, secret.substr(eq + 1));
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            std::uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return StationError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > 86400000u) {
                return StationError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 86400000."};
            }
            config.request_timeout = std::chrono::milliseconds(timeout);
        }

        if (raw.secrets_file) {
            std::filesystem::path p(raw.secrets_file.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return StationError{ErrorCategory::Input, "Secrets file does not exist: " + p.string(), "invalid_path"};
            }
            config.secrets_file = std::move(p);
        }

        if (raw.report_dir) {
            std::filesystem::path p(raw.report_dir.value());
            std::error_code path_ec;
            if (std::filesystem::exists(p, path_ec) && !std::filesystem::is_directory(p, path_ec)) {
                return StationError{ErrorCategory::Input, "Report path is not a directory: " + p.string(), "invalid_path"};
            }
            config.report_dir = std::move(p);
        }

        return config;
    }

} // namespace station::app::cli
