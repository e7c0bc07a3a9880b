#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"

namespace coderunner::core::config {

constexpr std::uint32_t kDefaultTimeoutMs = 8000;
constexpr std::uint32_t kMaxTimeoutMs = 600000;

// Programs each default pipeline invokes. Plain names are looked up on PATH.
struct ToolchainConfig {
    std::string python = "python3";
    std::string javascript = "node";
    std::string javac = "javac";
    std::string java = "java";
    std::string cxx = "g++";
    std::vector<std::string> cxx_flags = {"-O2"};
};

struct EngineConfig {
    std::filesystem::path scratch_dir = default_scratch_dir();
    std::uint32_t build_timeout_ms = kDefaultTimeoutMs;
    std::uint32_t run_timeout_ms = kDefaultTimeoutMs;
    ToolchainConfig toolchain;
    logging::LogLevel log_level = logging::LogLevel::INFO;

    static std::filesystem::path default_scratch_dir();
};

// Overlays the keys present in `data` on top of `base`.
errors::Result<EngineConfig> apply_config_json(const nlohmann::json& data,
                                               EngineConfig base);

errors::Result<EngineConfig> load_config_file(const std::filesystem::path& path,
                                              EngineConfig base);

// Parses a millisecond budget; accepts 1..kMaxTimeoutMs.
errors::Result<std::uint32_t> parse_timeout_ms(const std::string& text,
                                               const std::string& name);

}  // namespace coderunner::core::config
