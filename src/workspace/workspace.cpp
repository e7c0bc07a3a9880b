#include "workspace/workspace.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/config/unique_id.hpp"
#include "core/logging/logger.hpp"

namespace coderunner::workspace {

using core::errors::ErrorCategory;
using core::errors::RunError;

namespace {

constexpr int kMaxAttempts = 16;

// Creates `path` exclusively (O_EXCL) and writes all of `content`.
// Returns 0 or the errno of the failing call.
int write_exclusive(const std::filesystem::path& path, const std::string& content) {
    const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return errno;
    }

    std::size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            static_cast<void>(close(fd));
            std::error_code ec;
            std::filesystem::remove(path, ec);
            return err;
        }
        written += static_cast<std::size_t>(n);
    }

    if (close(fd) != 0) {
        const int err = errno;
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return err;
    }
    return 0;
}

}  // namespace

void ArtifactSet::add(std::filesystem::path path) {
    if (!contains(path)) {
        paths_.push_back(std::move(path));
    }
}

bool ArtifactSet::contains(const std::filesystem::path& path) const {
    return std::find(paths_.begin(), paths_.end(), path) != paths_.end();
}

std::vector<std::filesystem::path> ArtifactSet::take() {
    std::vector<std::filesystem::path> taken;
    taken.swap(paths_);
    return taken;
}

Workspace::Workspace(std::filesystem::path scratch_root)
    : scratch_root_(std::move(scratch_root)) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(scratch_root_, ec);
    if (!ec) {
        scratch_root_ = absolute.lexically_normal();
    }
    // "/tmp/scratch/" normalizes with an empty last element.
    if (!scratch_root_.has_filename() && scratch_root_.has_parent_path() &&
        scratch_root_ != scratch_root_.root_path()) {
        scratch_root_ = scratch_root_.parent_path();
    }
}

core::errors::Result<std::filesystem::path> Workspace::ensure_root() const {
    std::error_code ec;
    std::filesystem::create_directories(scratch_root_, ec);
    if (ec) {
        return RunError{ErrorCategory::Internal,
                        "Unable to create scratch directory: " +
                            scratch_root_.string() + " (" + ec.message() + ")",
                        "scratch_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(scratch_root_, ec) || ec) {
        return RunError{ErrorCategory::Internal,
                        "Scratch path is not a directory: " +
                            scratch_root_.string(),
                        "invalid_scratch_dir"};
    }
    return scratch_root_;
}

core::errors::Result<std::filesystem::path> Workspace::allocate(
    const std::string& extension, const std::string& content) const {
    auto root_result = ensure_root();
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const auto& root = core::errors::get_value(root_result);

    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const auto path =
            root / (core::config::generate_scratch_stem() + "." + extension);
        const int err = write_exclusive(path, content);
        if (err == EEXIST) {
            continue;
        }
        if (err != 0) {
            return RunError{ErrorCategory::Internal,
                            "Unable to write source file: " + path.string() + " (" +
                                std::strerror(err) + ")",
                            "source_write_failed"};
        }
        LOG_DEBUG("Workspace: allocated " + path.string());
        return path;
    }

    return RunError{ErrorCategory::Internal,
                    "Unable to allocate a unique scratch file name.",
                    "scratch_name_exhausted"};
}

core::errors::Result<std::filesystem::path> Workspace::allocate_directory() const {
    auto root_result = ensure_root();
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const auto& root = core::errors::get_value(root_result);

    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const auto path = root / core::config::generate_scratch_stem();
        std::error_code ec;
        const bool created = std::filesystem::create_directory(path, ec);
        if (ec) {
            return RunError{ErrorCategory::Internal,
                            "Unable to create scratch directory: " + path.string() +
                                " (" + ec.message() + ")",
                            "scratch_dir_create_failed"};
        }
        if (!created) {
            continue;
        }
        LOG_DEBUG("Workspace: allocated directory " + path.string());
        return path;
    }

    return RunError{ErrorCategory::Internal,
                    "Unable to allocate a unique scratch directory name.",
                    "scratch_name_exhausted"};
}

core::errors::Result<std::filesystem::path> Workspace::allocate_in(
    const std::filesystem::path& directory, const std::string& file_name,
    const std::string& content) const {
    if (!is_within_root(directory)) {
        return RunError{ErrorCategory::Internal,
                        "Directory is outside the scratch root: " +
                            directory.string(),
                        "path_outside_scratch"};
    }

    const auto path = directory / file_name;
    const int err = write_exclusive(path, content);
    if (err != 0) {
        return RunError{ErrorCategory::Internal,
                        "Unable to write source file: " + path.string() + " (" +
                            std::strerror(err) + ")",
                        "source_write_failed"};
    }
    return path;
}

std::filesystem::path Workspace::derived_path(const std::filesystem::path& path,
                                              const std::string& new_extension) {
    auto derived = path;
    derived.replace_extension(new_extension.empty() ? "" : "." + new_extension);
    return derived;
}

bool Workspace::is_within_root(const std::filesystem::path& path) const {
    const auto normal = path.lexically_normal();
    auto root_it = scratch_root_.begin();
    auto child_it = normal.begin();
    for (; root_it != scratch_root_.end() && child_it != normal.end();
         ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    // The root itself is never released.
    return root_it == scratch_root_.end() && child_it != normal.end();
}

std::size_t Workspace::release(const std::vector<std::filesystem::path>& paths) const {
    std::size_t removed = 0;
    for (auto it = paths.rbegin(); it != paths.rend(); ++it) {
        const auto& path = *it;
        if (!is_within_root(path)) {
            LOG_ERROR("Workspace: refusing to delete path outside scratch root: " +
                      path.string());
            continue;
        }

        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (ec || !std::filesystem::exists(status)) {
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            std::filesystem::remove_all(path, ec);
        } else {
            std::filesystem::remove(path, ec);
        }
        if (ec) {
            LOG_WARN("Workspace: failed to delete " + path.string() + ": " +
                     ec.message());
            continue;
        }
        ++removed;
    }
    return removed;
}

}  // namespace coderunner::workspace
