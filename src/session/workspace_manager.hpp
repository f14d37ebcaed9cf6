#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include "core/errors/transpile_errors.hpp"

namespace transpiler::session {

struct Workspace {
    std::string id;
    std::filesystem::path root_dir;
    std::filesystem::path input_file;
};

class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path base_dir);

    // Creates a fresh directory under the base dir and writes source_text
    // verbatim into input.py. Fails with an IO error, leaving nothing behind.
    core::errors::Result<Workspace> acquire(const std::string& source_text);

    // Idempotent and non-throwing. Secondary errors are logged, not reported.
    void release(const Workspace& workspace) noexcept;

    const std::filesystem::path& base_dir() const { return base_dir_; }
    std::size_t acquired_count() const { return acquired_.load(); }
    std::size_t released_count() const { return released_.load(); }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    std::filesystem::path base_dir_;
    std::atomic<std::size_t> acquired_{0};
    std::atomic<std::size_t> released_{0};
};

// Releases the workspace exactly once when the scope ends, whichever way it ends.
class ScopedWorkspace {
public:
    ScopedWorkspace(WorkspaceManager& manager, Workspace workspace);
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    const Workspace& get() const { return workspace_; }

private:
    WorkspaceManager& manager_;
    Workspace workspace_;
};

}  // namespace transpiler::session
