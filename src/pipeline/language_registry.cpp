#include "pipeline/language_registry.hpp"

#include <cctype>
#include <string>
#include <utility>
#include "pipeline/which.hpp"

namespace coderunner::pipeline {

using core::errors::ErrorCategory;
using core::errors::RunError;

namespace {

// Single left-to-right pass: text coming from a binding is never scanned
// again, so a path that itself contains "{entry}" stays as it is.
std::string substitute(const std::string& text, const PathBindings& bindings) {
    const std::pair<const char*, std::string> placeholders[] = {
        {"{source}", bindings.source.string()},
        {"{output}", bindings.output.string()},
        {"{dir}", bindings.dir.string()},
        {"{scratch}", bindings.scratch.string()},
        {"{entry}", bindings.entry},
    };

    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        bool replaced = false;
        if (text[pos] == '{') {
            for (const auto& [name, value] : placeholders) {
                const std::size_t length = std::char_traits<char>::length(name);
                if (text.compare(pos, length, name) == 0) {
                    result += value;
                    pos += length;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            result += text[pos];
            ++pos;
        }
    }
    return result;
}

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Advances `pos` past whitespace; false if there was none.
bool skip_spaces(const std::string& text, std::size_t& pos) {
    const std::size_t start = pos;
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos > start;
}

bool is_placeholder_program(const std::string& program) {
    return program.find('{') != std::string::npos;
}

}  // namespace

CommandSpec bind(const CommandTemplate& command, const PathBindings& bindings) {
    CommandSpec spec;
    spec.program = substitute(command.program, bindings);
    spec.args.reserve(command.args.size());
    for (const auto& arg : command.args) {
        spec.args.push_back(substitute(arg, bindings));
    }
    spec.working_directory = bindings.dir;
    return spec;
}

std::string rename_public_class(const std::string& source,
                                const std::string& entry_point) {
    static const std::string kPublic = "public";
    static const std::string kClass = "class";

    std::size_t start = source.find(kPublic);
    while (start != std::string::npos) {
        std::size_t pos = start + kPublic.size();
        if (skip_spaces(source, pos) && source.compare(pos, kClass.size(), kClass) == 0) {
            pos += kClass.size();
            if (skip_spaces(source, pos) && pos < source.size() && is_word(source[pos])) {
                while (pos < source.size() && is_word(source[pos])) {
                    ++pos;
                }
                return source.substr(0, start) + "public class " + entry_point +
                       source.substr(pos);
            }
        }
        start = source.find(kPublic, start + 1);
    }
    return source;
}

LanguageRegistry LanguageRegistry::with_defaults(
    const core::config::ToolchainConfig& toolchain) {
    LanguageRegistry registry;

    LanguagePipeline python;
    python.source_extension = "py";
    python.run = CommandTemplate{toolchain.python, {"{source}"}};
    registry.register_pipeline("python", std::move(python));

    LanguagePipeline javascript;
    javascript.source_extension = "js";
    javascript.run = CommandTemplate{toolchain.javascript, {"{source}"}};
    registry.register_pipeline("javascript", std::move(javascript));

    LanguagePipeline java;
    java.source_extension = "java";
    java.layout = SourceLayout::PrivateDirectory;
    java.entry_point = "Main";
    java.rewrite_source = [](const std::string& source) {
        return rename_public_class(source, "Main");
    };
    java.build = CommandTemplate{toolchain.javac, {"{source}"}};
    java.output_extension = "class";
    java.run = CommandTemplate{toolchain.java, {"-cp", "{dir}", "{entry}"}};
    registry.register_pipeline("java", std::move(java));

    LanguagePipeline cpp;
    cpp.source_extension = "cpp";
    CommandTemplate compile{toolchain.cxx, {"{source}"}};
    compile.args.insert(compile.args.end(), toolchain.cxx_flags.begin(),
                        toolchain.cxx_flags.end());
    compile.args.push_back("-o");
    compile.args.push_back("{output}");
    cpp.build = std::move(compile);
#ifdef _WIN32
    cpp.output_extension = "exe";
#else
    cpp.output_extension = "out";
#endif
    cpp.run = CommandTemplate{"{output}", {}};
    registry.register_pipeline("cpp", std::move(cpp));

    return registry;
}

void LanguageRegistry::register_pipeline(const std::string& language,
                                         LanguagePipeline pipeline) {
    pipelines_[language] = std::move(pipeline);
}

core::errors::Result<const LanguagePipeline*> LanguageRegistry::resolve(
    const std::string& language) const {
    auto it = pipelines_.find(language);
    if (it == pipelines_.end()) {
        return RunError{ErrorCategory::Input, "Unsupported language: " + language,
                        "unsupported_language"};
    }
    return &it->second;
}

std::vector<std::string> LanguageRegistry::languages() const {
    std::vector<std::string> names;
    names.reserve(pipelines_.size());
    for (const auto& entry : pipelines_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> LanguageRegistry::missing_programs() const {
    std::vector<std::string> missing;
    for (const auto& [language, pipeline] : pipelines_) {
        std::vector<std::string> programs;
        if (pipeline.build.has_value()) {
            programs.push_back(pipeline.build->program);
        }
        programs.push_back(pipeline.run.program);
        for (const auto& program : programs) {
            if (is_placeholder_program(program)) {
                continue;
            }
            if (!which(program).has_value()) {
                missing.push_back(language + ": " + program);
            }
        }
    }
    return missing;
}

}  // namespace coderunner::pipeline
