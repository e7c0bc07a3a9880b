#include <csignal>
#include <chrono>
#include <iostream>
#include <string>
#include "app/batch_runner.hpp"
#include "app/cli_parser.hpp"
#include "app/serve_loop.hpp"
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/run_request.hpp"
#include "runtime/execution_engine.hpp"

int main(int argc, char* argv[]) {
    using coderunner::core::errors::get_error;
    using coderunner::core::errors::get_value;
    using coderunner::core::errors::is_error;

    // A child closing its stdin early must not take the engine down.
    std::signal(SIGPIPE, SIG_IGN);

    coderunner::core::logging::Logger::get().set_tag("coderunner");

    auto parsed = coderunner::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        const auto& err = get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& invocation = get_value(parsed);
    const auto& config = invocation.config;
    coderunner::core::logging::Logger::get().set_min_level(config.log_level);
    if (invocation.config_file) {
        LOG_DEBUG("Loaded configuration from " + *invocation.config_file);
    }

    auto engine = coderunner::runtime::ExecutionEngine::from_config(config);
    auto root = engine->workspace().ensure_root();
    if (is_error(root)) {
        const auto& err = get_error(root);
        LOG_ERROR("Scratch directory unusable [" + err.code + "]: " + err.message);
        return 3;
    }
    LOG_INFO("Scratch directory: " + get_value(root).string());

    for (const auto& program : engine->registry().missing_programs()) {
        LOG_WARN("Toolchain program not found on PATH: " + program);
    }

    if (invocation.command == coderunner::app::cli::Command::Serve) {
        // Long enough for a run that started just before EOF to finish both phases.
        const std::chrono::milliseconds drain_timeout(
            static_cast<long long>(config.build_timeout_ms) + config.run_timeout_ms + 1000);
        LOG_INFO("Serving one session on stdin/stdout");
        return coderunner::app::run_serve_loop(std::cin, std::cout, engine, drain_timeout);
    }

    coderunner::protocol::ExecutionRequest request;
    request.language = invocation.language;
    request.source_text = invocation.source_text;
    request.stdin_text = invocation.stdin_text;

    const auto result = coderunner::app::run_batch(*engine, request);
    std::cout << coderunner::app::to_json(result).dump(
                     -1, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    if (result.engine_error) {
        LOG_ERROR("Run failed: " + result.stderr_text);
        return 1;
    }
    return 0;
}
