#include "cli_parser.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace coderunner::app::cli {

    using namespace coderunner::core::errors;
    using coderunner::core::config::EngineConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> scratch_dir;
        std::optional<std::string> build_timeout_ms;
        std::optional<std::string> run_timeout_ms;
        std::optional<std::string> log_level;
        std::optional<std::string> language;
        std::optional<std::string> file;
        std::optional<std::string> code;
        std::optional<std::string> input;
    };

    namespace {

        Result<std::string> read_source_file(const std::string& path_text) {
            std::filesystem::path p(path_text);
            std::error_code ec;
            if (!std::filesystem::is_regular_file(p, ec) || ec) {
                return RunError{ErrorCategory::Input, "Source file does not exist or is not a regular file: " + path_text, "invalid_path"};
            }
            std::ifstream in(p, std::ios::binary);
            if (!in.is_open()) {
                return RunError{ErrorCategory::Input, "Unable to open source file: " + path_text, "invalid_path"};
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            return buffer.str();
        }

    } // namespace

    Result<CliInvocation> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return RunError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: coderunner serve | coderunner run --language <id> --file <path>"};
        }

        CliInvocation invocation;
        std::string command = argv[1];
        if (command == "serve") {
            invocation.command = Command::Serve;
        } else if (command == "run") {
            invocation.command = Command::Run;
        } else {
            return RunError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: serve, run."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> value_flags = {
            {"--config", &raw.config},
            {"--scratch-dir", &raw.scratch_dir},
            {"--build-timeout-ms", &raw.build_timeout_ms},
            {"--run-timeout-ms", &raw.run_timeout_ms},
            {"--log-level", &raw.log_level},
            {"--language", &raw.language},
            {"--file", &raw.file},
            {"--code", &raw.code},
            {"--input", &raw.input},
        };

        for (size_t i = 0; i < args.size(); ++i) {
            bool matched = false;
            for (const auto& [flag, target] : value_flags) {
                if (args[i] != flag) continue;
                if (i + 1 >= args.size()) {
                    return RunError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *target = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return RunError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        if (invocation.command == Command::Serve) {
            if (raw.language || raw.file || raw.code || raw.input) {
                return RunError{ErrorCategory::Input, "--language, --file, --code and --input are only valid for 'run'", "unexpected_flag"};
            }
        } else {
            if (!raw.language.has_value()) {
                return RunError{ErrorCategory::Input, "Must provide --language", "missing_required_flag"};
            }
            // Mutual Exclusion XOR check
            if (!raw.file.has_value() && !raw.code.has_value()) {
                return RunError{ErrorCategory::Input, "Must provide either --file or --code", "missing_required_flag"};
            }
            if (raw.file.has_value() && raw.code.has_value()) {
                return RunError{ErrorCategory::Input, "Cannot provide both --file and --code", "conflicting_flags"};
            }

            invocation.language = raw.language.value();
            if (raw.code) {
                invocation.source_text = raw.code.value();
            } else {
                auto source = read_source_file(raw.file.value());
                if (is_error(source)) return get_error(source);
                invocation.source_text = get_value(source);
            }
            invocation.stdin_text = raw.input;
        }

        // Config file first, flags override it
        if (raw.config) {
            auto loaded = core::config::load_config_file(raw.config.value(), invocation.config);
            if (is_error(loaded)) return get_error(loaded);
            invocation.config = get_value(loaded);
            invocation.config_file = raw.config;
        }

        if (raw.build_timeout_ms) {
            auto parsed = core::config::parse_timeout_ms(raw.build_timeout_ms.value(), "--build-timeout-ms");
            if (is_error(parsed)) return get_error(parsed);
            invocation.config.build_timeout_ms = get_value(parsed);
        }
        if (raw.run_timeout_ms) {
            auto parsed = core::config::parse_timeout_ms(raw.run_timeout_ms.value(), "--run-timeout-ms");
            if (is_error(parsed)) return get_error(parsed);
            invocation.config.run_timeout_ms = get_value(parsed);
        }

        if (raw.log_level) {
            auto level = core::logging::parse_log_level(raw.log_level.value());
            if (!level.has_value()) {
                return RunError{ErrorCategory::Input, "Unknown log level: " + raw.log_level.value(), "invalid_log_level", "Use one of: debug, info, warn, error."};
            }
            invocation.config.log_level = level.value();
        }

        // Path validation: created lazily, but must not be something else
        if (raw.scratch_dir) {
            std::filesystem::path p(raw.scratch_dir.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (!path_ec && exists && !std::filesystem::is_directory(p, path_ec)) {
                return RunError{ErrorCategory::Input, "Scratch path exists and is not a directory", "invalid_path"};
            }
            invocation.config.scratch_dir = std::move(p);
        }

        return invocation;
    }

} // namespace coderunner::app::cli
