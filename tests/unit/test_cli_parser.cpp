#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/unique_id.hpp"
#include "core/errors/run_errors.hpp"

namespace {

using coderunner::app::cli::CliInvocation;
using coderunner::app::cli::Command;
using coderunner::app::cli::parse_and_validate;
using coderunner::core::errors::ErrorCategory;
using coderunner::core::errors::get_error;
using coderunner::core::errors::get_value;
using coderunner::core::errors::is_error;
using coderunner::core::logging::LogLevel;

coderunner::core::errors::Result<CliInvocation> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("coderunner");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class TempFile {
public:
    TempFile(const std::string& suffix, const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                ("coderunner_cli_" + coderunner::core::config::random_hex(6) + suffix);
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ServeUsesDefaults) {
    auto result = parse_tokens({"serve"});
    ASSERT_FALSE(is_error(result));
    const auto& invocation = get_value(result);
    EXPECT_EQ(invocation.command, Command::Serve);
    EXPECT_EQ(invocation.config.run_timeout_ms, 8000u);
    EXPECT_FALSE(invocation.config_file.has_value());
}

TEST(CliParserTest, ServeRejectsRunOnlyFlags) {
    auto result = parse_tokens({"serve", "--language", "python"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_flag");
}

TEST(CliParserTest, FailsWhenLanguageMissing) {
    auto result = parse_tokens({"run", "--code", "print(1)"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenSourceMissing) {
    auto result = parse_tokens({"run", "--language", "python"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFileAndCodeBothProvided) {
    auto result = parse_tokens({"run", "--language", "python", "--code", "x", "--file", "main.py"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"run", "--language"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"serve", "--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"serve", "--run-timeout-ms", "8s"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutOutOfBounds) {
    auto result = parse_tokens({"serve", "--build-timeout-ms", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsOnUnknownLogLevel) {
    auto result = parse_tokens({"serve", "--log-level", "loud"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, FailsWhenSourceFileMissing) {
    auto result = parse_tokens({"run", "--language", "python", "--file", "/nonexistent/main.py"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenScratchDirIsAFile) {
    TempFile file(".txt", "x");
    auto result = parse_tokens({"serve", "--scratch-dir", file.path()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, RunReadsSourceFileAndInput) {
    TempFile source(".py", "print(input())\n");
    auto result = parse_tokens({"run", "--language", "python", "--file", source.path(),
                                "--input", "hello\n"});
    ASSERT_FALSE(is_error(result));
    const auto& invocation = get_value(result);
    EXPECT_EQ(invocation.command, Command::Run);
    EXPECT_EQ(invocation.language, "python");
    EXPECT_EQ(invocation.source_text, "print(input())\n");
    ASSERT_TRUE(invocation.stdin_text.has_value());
    EXPECT_EQ(invocation.stdin_text.value(), "hello\n");
}

TEST(CliParserTest, FlagsOverrideConfigFile) {
    TempFile config(".json", R"({"runTimeoutMs": 2000, "buildTimeoutMs": 3000, "logLevel": "warn"})");
    auto result = parse_tokens({"serve", "--config", config.path(), "--run-timeout-ms", "500",
                                "--scratch-dir", "/tmp/coderunner-cli-test"});
    ASSERT_FALSE(is_error(result));
    const auto& invocation = get_value(result);
    ASSERT_TRUE(invocation.config_file.has_value());
    EXPECT_EQ(invocation.config.run_timeout_ms, 500u);
    EXPECT_EQ(invocation.config.build_timeout_ms, 3000u);
    EXPECT_EQ(invocation.config.log_level, LogLevel::WARN);
    EXPECT_EQ(invocation.config.scratch_dir, std::filesystem::path("/tmp/coderunner-cli-test"));
}

TEST(CliParserTest, ReportsBrokenConfigFile) {
    TempFile config(".json", "{ broken");
    auto result = parse_tokens({"serve", "--config", config.path()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_failed");
}

}  // namespace
