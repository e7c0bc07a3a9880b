#pragma once
#include <optional>
#include <string>
#include "core/config/engine_config.hpp"
#include "core/errors/run_errors.hpp"

namespace coderunner::app::cli {

    enum class Command {
        Serve,  // one interactive session over stdin/stdout
        Run     // one batch run, accumulated result printed as JSON
    };

    struct CliInvocation {
        Command command = Command::Serve;
        core::config::EngineConfig config;
        std::optional<std::string> config_file;

        // Only set for Command::Run
        std::string language;
        std::string source_text;
        std::optional<std::string> stdin_text;
    };

    coderunner::core::errors::Result<CliInvocation> parse_and_validate(int argc, char* argv[]);
}
