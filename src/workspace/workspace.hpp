#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/run_errors.hpp"

namespace coderunner::workspace {

// Ordered set of scratch paths created for one run. Owned by exactly one
// session; handed back to Workspace::release as a unit.
class ArtifactSet {
public:
    void add(std::filesystem::path path);
    bool contains(const std::filesystem::path& path) const;
    bool empty() const { return paths_.empty(); }
    std::size_t size() const { return paths_.size(); }
    const std::vector<std::filesystem::path>& paths() const { return paths_; }

    // Empties the set and returns what it held, in insertion order.
    std::vector<std::filesystem::path> take();

private:
    std::vector<std::filesystem::path> paths_;
};

class Workspace {
public:
    explicit Workspace(std::filesystem::path scratch_root);

    // Creates the scratch directory if needed and returns its canonical path.
    core::errors::Result<std::filesystem::path> ensure_root() const;

    // Writes `content` to <root>/tmp_<ms>_<hex>.<extension>. Never overwrites.
    core::errors::Result<std::filesystem::path> allocate(
        const std::string& extension, const std::string& content) const;

    // Creates an empty private directory <root>/tmp_<ms>_<hex>.
    core::errors::Result<std::filesystem::path> allocate_directory() const;

    // Writes `content` to <directory>/<file_name>; `directory` must come from
    // allocate_directory.
    core::errors::Result<std::filesystem::path> allocate_in(
        const std::filesystem::path& directory, const std::string& file_name,
        const std::string& content) const;

    // Sibling of `path` with the extension swapped; the stem is kept.
    static std::filesystem::path derived_path(const std::filesystem::path& path,
                                              const std::string& new_extension);

    // Removes every path, last added first. Directories go recursively.
    // Failures are logged and skipped; returns how many paths were removed.
    std::size_t release(const std::vector<std::filesystem::path>& paths) const;

    const std::filesystem::path& root() const { return scratch_root_; }

private:
    bool is_within_root(const std::filesystem::path& path) const;

    std::filesystem::path scratch_root_;
};

}  // namespace coderunner::workspace
