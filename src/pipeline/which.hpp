#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace coderunner::pipeline {

// Resolves `program` the way execvp would: names containing '/' are taken
// as-is, anything else is searched on PATH. Only executable regular files
// match.
std::optional<std::filesystem::path> which(const std::string& program);

}  // namespace coderunner::pipeline
