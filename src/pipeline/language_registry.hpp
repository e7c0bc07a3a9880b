#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/config/engine_config.hpp"
#include "core/errors/run_errors.hpp"

namespace coderunner::pipeline {

// An external command template. Every argument (and the program itself) may
// contain the placeholders {source}, {output}, {dir}, {scratch} and {entry}.
struct CommandTemplate {
    std::string program;
    std::vector<std::string> args;
};

// A concrete command: no shell is involved, argv is passed as-is.
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_directory;
};

enum class SourceLayout {
    // <scratch>/tmp_<ms>_<hex>.<ext>
    UniqueFile,
    // <scratch>/tmp_<ms>_<hex>/<entry>.<ext>, for toolchains that derive
    // names from the file name (javac)
    PrivateDirectory
};

struct LanguagePipeline {
    std::string source_extension;
    SourceLayout layout = SourceLayout::UniqueFile;
    std::string entry_point;
    std::function<std::string(const std::string&)> rewrite_source;
    std::optional<CommandTemplate> build;
    // Extension of the build's output next to the source; empty if the build
    // leaves nothing to track.
    std::string output_extension;
    CommandTemplate run;
};

// Paths bound into a pipeline's templates for one run.
struct PathBindings {
    std::filesystem::path source;
    std::filesystem::path output;
    std::filesystem::path dir;
    std::filesystem::path scratch;
    std::string entry;
};

CommandSpec bind(const CommandTemplate& command, const PathBindings& bindings);

// Renames the first `public class <Name>` to `public class <entry_point>`.
// Purely textual: a match inside a comment or string is renamed too.
std::string rename_public_class(const std::string& source,
                                const std::string& entry_point);

class LanguageRegistry {
public:
    // python, javascript, java and cpp, wired to `toolchain`.
    static LanguageRegistry with_defaults(const core::config::ToolchainConfig& toolchain);

    // Adds or replaces the pipeline for `language`.
    void register_pipeline(const std::string& language, LanguagePipeline pipeline);

    // Fails with "Unsupported language: <id>" for unknown identifiers.
    core::errors::Result<const LanguagePipeline*> resolve(const std::string& language) const;

    std::vector<std::string> languages() const;

    // "<language>: <program>" for every build/run program not found on PATH.
    std::vector<std::string> missing_programs() const;

private:
    std::map<std::string, LanguagePipeline> pipelines_;
};

}  // namespace coderunner::pipeline
