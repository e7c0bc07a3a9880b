#include "core/config/engine_config.hpp"

#include <charconv>
#include <fstream>
#include <system_error>
#include <utility>

namespace coderunner::core::config {

using errors::ErrorCategory;
using errors::RunError;
using nlohmann::json;

namespace {

errors::Result<std::uint32_t> validate_timeout(const std::int64_t value,
                                               const std::string& name) {
    if (value < 1 || value > static_cast<std::int64_t>(kMaxTimeoutMs)) {
        return RunError{ErrorCategory::Input, name + " out of bounds",
                        "bounds_error",
                        "Must be between 1 and " + std::to_string(kMaxTimeoutMs) +
                            " milliseconds."};
    }
    return static_cast<std::uint32_t>(value);
}

RunError type_error(const std::string& key, const std::string& expected) {
    return RunError{ErrorCategory::Input,
                    "Config key '" + key + "' must be " + expected,
                    "invalid_config_value"};
}

}  // namespace

std::filesystem::path EngineConfig::default_scratch_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "coderunner";
}

errors::Result<std::uint32_t> parse_timeout_ms(const std::string& text,
                                               const std::string& name) {
    std::int64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return RunError{ErrorCategory::Input, "Invalid number for " + name,
                        "invalid_integer", "Provide a positive integer."};
    }
    return validate_timeout(value, name);
}

errors::Result<EngineConfig> apply_config_json(const json& data,
                                               EngineConfig base) {
    if (!data.is_object()) {
        return RunError{ErrorCategory::Input,
                        "Config root must be a JSON object",
                        "invalid_config_value"};
    }

    if (data.contains("scratchDir")) {
        if (!data["scratchDir"].is_string()) {
            return type_error("scratchDir", "a string");
        }
        base.scratch_dir = data["scratchDir"].get<std::string>();
    }

    for (const auto& [key, target] :
         {std::pair<const char*, std::uint32_t*>{"buildTimeoutMs", &base.build_timeout_ms},
          std::pair<const char*, std::uint32_t*>{"runTimeoutMs", &base.run_timeout_ms}}) {
        if (!data.contains(key)) {
            continue;
        }
        if (!data[key].is_number_integer()) {
            return type_error(key, "an integer");
        }
        auto validated = validate_timeout(data[key].get<std::int64_t>(), key);
        if (errors::is_error(validated)) {
            return errors::get_error(validated);
        }
        *target = errors::get_value(validated);
    }

    if (data.contains("logLevel")) {
        if (!data["logLevel"].is_string()) {
            return type_error("logLevel", "a string");
        }
        const auto level = logging::parse_log_level(data["logLevel"].get<std::string>());
        if (!level.has_value()) {
            return RunError{ErrorCategory::Input, "Unknown log level in config",
                            "invalid_config_value",
                            "Use one of: debug, info, warn, error."};
        }
        base.log_level = level.value();
    }

    if (data.contains("toolchain")) {
        const auto& toolchain = data["toolchain"];
        if (!toolchain.is_object()) {
            return type_error("toolchain", "an object");
        }
        for (const auto& [key, target] :
             {std::pair<const char*, std::string*>{"python", &base.toolchain.python},
              std::pair<const char*, std::string*>{"javascript", &base.toolchain.javascript},
              std::pair<const char*, std::string*>{"javac", &base.toolchain.javac},
              std::pair<const char*, std::string*>{"java", &base.toolchain.java},
              std::pair<const char*, std::string*>{"cxx", &base.toolchain.cxx}}) {
            if (!toolchain.contains(key)) {
                continue;
            }
            if (!toolchain[key].is_string() || toolchain[key].get<std::string>().empty()) {
                return type_error(std::string("toolchain.") + key, "a non-empty string");
            }
            *target = toolchain[key].get<std::string>();
        }
        if (toolchain.contains("cxxFlags")) {
            const auto& flags = toolchain["cxxFlags"];
            if (!flags.is_array()) {
                return type_error("toolchain.cxxFlags", "an array of strings");
            }
            std::vector<std::string> parsed;
            for (const auto& flag : flags) {
                if (!flag.is_string()) {
                    return type_error("toolchain.cxxFlags", "an array of strings");
                }
                parsed.push_back(flag.get<std::string>());
            }
            base.toolchain.cxx_flags = std::move(parsed);
        }
    }

    return base;
}

errors::Result<EngineConfig> load_config_file(const std::filesystem::path& path,
                                              EngineConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return RunError{ErrorCategory::Input,
                        "Unable to open config file: " + path.string(),
                        "config_open_failed"};
    }

    const json data = json::parse(in, nullptr, false);
    if (data.is_discarded()) {
        return RunError{ErrorCategory::Input,
                        "Config file is not valid JSON: " + path.string(),
                        "config_parse_failed"};
    }
    return apply_config_json(data, std::move(base));
}

}  // namespace coderunner::core::config
