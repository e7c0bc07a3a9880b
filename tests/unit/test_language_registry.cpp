#include <algorithm>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/engine_config.hpp"
#include "core/errors/run_errors.hpp"
#include "pipeline/language_registry.hpp"
#include "pipeline/which.hpp"

namespace {

using coderunner::core::config::ToolchainConfig;
using coderunner::core::errors::ErrorCategory;
using coderunner::core::errors::get_error;
using coderunner::core::errors::get_value;
using coderunner::core::errors::is_error;
using coderunner::pipeline::bind;
using coderunner::pipeline::CommandTemplate;
using coderunner::pipeline::LanguagePipeline;
using coderunner::pipeline::LanguageRegistry;
using coderunner::pipeline::PathBindings;
using coderunner::pipeline::rename_public_class;
using coderunner::pipeline::SourceLayout;
using coderunner::pipeline::which;

PathBindings sample_bindings() {
    PathBindings bindings;
    bindings.source = "/scratch/tmp_1_aa.cpp";
    bindings.output = "/scratch/tmp_1_aa.out";
    bindings.dir = "/scratch";
    bindings.scratch = "/scratch";
    bindings.entry = "Main";
    return bindings;
}

TEST(LanguageRegistryTest, DefaultsCoverFourLanguages) {
    const auto registry = LanguageRegistry::with_defaults(ToolchainConfig{});
    const auto languages = registry.languages();
    ASSERT_EQ(languages.size(), 4u);
    for (const std::string id : {"python", "javascript", "java", "cpp"}) {
        EXPECT_FALSE(is_error(registry.resolve(id))) << id;
    }
}

TEST(LanguageRegistryTest, UnknownLanguageIsAnInputError) {
    const auto registry = LanguageRegistry::with_defaults(ToolchainConfig{});
    auto result = registry.resolve("cobol");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).message, "Unsupported language: cobol");
    EXPECT_EQ(get_error(result).code, "unsupported_language");

    // Identifiers are exact-match.
    EXPECT_TRUE(is_error(registry.resolve("Python")));
}

TEST(LanguageRegistryTest, InterpretedLanguagesHaveNoBuild) {
    const auto registry = LanguageRegistry::with_defaults(ToolchainConfig{});
    const LanguagePipeline& python = *get_value(registry.resolve("python"));
    EXPECT_EQ(python.source_extension, "py");
    EXPECT_FALSE(python.build.has_value());
    EXPECT_EQ(python.run.program, "python3");

    const LanguagePipeline& js = *get_value(registry.resolve("javascript"));
    EXPECT_EQ(js.source_extension, "js");
    EXPECT_FALSE(js.build.has_value());
    EXPECT_EQ(js.run.program, "node");
}

TEST(LanguageRegistryTest, CppBuildsThenRunsOutput) {
    ToolchainConfig toolchain;
    toolchain.cxx = "clang++";
    toolchain.cxx_flags = {"-O1", "-std=c++17"};
    const auto registry = LanguageRegistry::with_defaults(toolchain);
    const LanguagePipeline& cpp = *get_value(registry.resolve("cpp"));
    ASSERT_TRUE(cpp.build.has_value());

    const auto build = bind(cpp.build.value(), sample_bindings());
    EXPECT_EQ(build.program, "clang++");
    const std::vector<std::string> expected = {"/scratch/tmp_1_aa.cpp", "-O1", "-std=c++17",
                                               "-o", "/scratch/tmp_1_aa.out"};
    EXPECT_EQ(build.args, expected);

    const auto run = bind(cpp.run, sample_bindings());
    EXPECT_EQ(run.program, "/scratch/tmp_1_aa.out");
    EXPECT_TRUE(run.args.empty());
    EXPECT_EQ(run.working_directory, std::filesystem::path("/scratch"));
}

TEST(LanguageRegistryTest, JavaUsesPrivateDirectoryAndMainEntry) {
    const auto registry = LanguageRegistry::with_defaults(ToolchainConfig{});
    const LanguagePipeline& java = *get_value(registry.resolve("java"));
    EXPECT_EQ(java.layout, SourceLayout::PrivateDirectory);
    EXPECT_EQ(java.entry_point, "Main");
    EXPECT_EQ(java.output_extension, "class");
    ASSERT_TRUE(java.rewrite_source);
    EXPECT_EQ(java.rewrite_source("public class Hello { }"), "public class Main { }");

    PathBindings bindings;
    bindings.source = "/scratch/tmp_2_bb/Main.java";
    bindings.dir = "/scratch/tmp_2_bb";
    bindings.entry = "Main";
    const auto run = bind(java.run, bindings);
    EXPECT_EQ(run.program, "java");
    const std::vector<std::string> expected = {"-cp", "/scratch/tmp_2_bb", "Main"};
    EXPECT_EQ(run.args, expected);
}

TEST(LanguageRegistryTest, RenamePublicClassTouchesFirstMatchOnly) {
    const std::string source =
        "public   class\tSolution {\n}\npublic class Helper {}\nclass Other {}\n";
    EXPECT_EQ(rename_public_class(source, "Main"),
              "public class Main {\n}\npublic class Helper {}\nclass Other {}\n");

    const std::string no_public = "class Main { public static void main(String[] a) {} }";
    EXPECT_EQ(rename_public_class(no_public, "Main"), no_public);
}

TEST(LanguageRegistryTest, RenamePublicClassHandlesHugeWhitespaceRuns) {
    const std::string gap(1 << 20, ' ');
    const std::string source = "public\n" + gap + "class" + std::string(1 << 20, '\t') +
                               "Foo {}";
    EXPECT_EQ(rename_public_class(source, "Main"), "public class Main {}");

    const std::string no_class = "public" + gap + "static int x;";
    EXPECT_EQ(rename_public_class(no_class, "Main"), no_class);
}

TEST(LanguageRegistryTest, RenamePublicClassRequiresWhitespaceAndName) {
    EXPECT_EQ(rename_public_class("publicclass Foo", "Main"), "publicclass Foo");
    EXPECT_EQ(rename_public_class("public classy Foo", "Main"), "public classy Foo");
    EXPECT_EQ(rename_public_class("public class {", "Main"), "public class {");
    EXPECT_EQ(rename_public_class("// public note\npublic class Foo_1 {}", "Main"),
              "// public note\npublic class Main {}");
}

TEST(LanguageRegistryTest, BindDoesNotExpandPlaceholdersInsideBoundPaths) {
    PathBindings bindings;
    bindings.source = "/scratch/{entry}/tmp_3_cc.java";
    bindings.dir = "/scratch/{entry}";
    bindings.scratch = "/scratch/{entry}";
    bindings.entry = "Main";

    CommandTemplate command{"javac", {"{source}", "-d", "{dir}", "{entry}"}};
    const auto spec = bind(command, bindings);
    const std::vector<std::string> expected = {"/scratch/{entry}/tmp_3_cc.java", "-d",
                                               "/scratch/{entry}", "Main"};
    EXPECT_EQ(spec.args, expected);
    EXPECT_EQ(bind(CommandTemplate{"{unknown}{dir", {}}, bindings).program, "{unknown}{dir");
}

TEST(LanguageRegistryTest, BindReplacesEveryPlaceholderOccurrence) {
    CommandTemplate command{"{scratch}/tool", {"--in={source}", "{source}{source}", "{entry}"}};
    const auto spec = bind(command, sample_bindings());
    EXPECT_EQ(spec.program, "/scratch/tool");
    const std::vector<std::string> expected = {"--in=/scratch/tmp_1_aa.cpp",
                                               "/scratch/tmp_1_aa.cpp/scratch/tmp_1_aa.cpp",
                                               "Main"};
    EXPECT_EQ(spec.args, expected);
}

TEST(LanguageRegistryTest, RegisterPipelineAddsAndReplaces) {
    auto registry = LanguageRegistry::with_defaults(ToolchainConfig{});
    LanguagePipeline sh;
    sh.source_extension = "sh";
    sh.run = CommandTemplate{"/bin/sh", {"{source}"}};
    registry.register_pipeline("sh", sh);
    EXPECT_FALSE(is_error(registry.resolve("sh")));
    EXPECT_EQ(registry.languages().size(), 5u);

    sh.run.program = "/bin/dash";
    registry.register_pipeline("sh", sh);
    EXPECT_EQ(get_value(registry.resolve("sh"))->run.program, "/bin/dash");
    EXPECT_EQ(registry.languages().size(), 5u);
}

TEST(LanguageRegistryTest, ReportsMissingPrograms) {
    ToolchainConfig toolchain;
    toolchain.python = "coderunner-no-such-python";
    const auto registry = LanguageRegistry::with_defaults(toolchain);
    const auto missing = registry.missing_programs();
    EXPECT_NE(std::find(missing.begin(), missing.end(), "python: coderunner-no-such-python"),
              missing.end());
}

TEST(WhichTest, ResolvesOnPathAndTakesSlashesLiterally) {
    const auto sh = which("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(sh->is_absolute());

    EXPECT_FALSE(which("coderunner-definitely-missing").has_value());
    EXPECT_TRUE(which("/bin/sh").has_value());
    EXPECT_FALSE(which("/nonexistent/sh").has_value());
}

}  // namespace
