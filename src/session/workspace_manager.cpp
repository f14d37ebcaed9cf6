#include "session/workspace_manager.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include "core/config/invocation_id.hpp"
#include "core/logging/logger.hpp"

namespace transpiler::session {

using core::errors::ErrorCategory;
using core::errors::TranspileError;

namespace {

constexpr const char* kInputFileName = "input.py";

}  // namespace

WorkspaceManager::WorkspaceManager(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {
    // "/tmp/x/" iterates with a trailing empty element; drop it so the
    // containment check in release() compares like with like.
    if (!base_dir_.has_filename() && base_dir_.has_parent_path() &&
        base_dir_ != base_dir_.root_path()) {
        base_dir_ = base_dir_.parent_path();
    }
}

bool WorkspaceManager::is_within_root(const std::filesystem::path& root,
                                      const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() && child_it != child.end();
}

core::errors::Result<Workspace> WorkspaceManager::acquire(
    const std::string& source_text) {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
    if (ec) {
        LOG_ERROR("WorkspaceManager: cannot create base dir " + base_dir_.string() +
                  ": " + ec.message());
        return TranspileError{ErrorCategory::IO,
                              "Unable to create workspace area.",
                              "workspace_base_create_failed"};
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        Workspace workspace;
        workspace.id = core::config::generate_invocation_id();
        workspace.root_dir = base_dir_ / workspace.id;
        workspace.input_file = workspace.root_dir / kInputFileName;

        // create_directory reports false for an existing path, so two calls can
        // never end up sharing a directory.
        const bool created = std::filesystem::create_directory(workspace.root_dir, ec);
        if (ec) {
            LOG_ERROR("[" + workspace.id + "] WorkspaceManager: cannot create " +
                      workspace.root_dir.string() +
                      ": " + ec.message());
            return TranspileError{ErrorCategory::IO,
                                  "Unable to create workspace directory.",
                                  "workspace_create_failed"};
        }
        if (!created) {
            LOG_WARN("[" + workspace.id + "] WorkspaceManager: name collision, retrying");
            continue;
        }
        acquired_.fetch_add(1);

        bool written = false;
        {
            std::ofstream out(workspace.input_file, std::ios::binary | std::ios::trunc);
            if (out.is_open()) {
                out.write(source_text.data(),
                          static_cast<std::streamsize>(source_text.size()));
                out.flush();
                written = out.good();
            }
        }
        if (!written) {
            LOG_ERROR("[" + workspace.id + "] WorkspaceManager: cannot write " +
                      workspace.input_file.string());
            release(workspace);
            return TranspileError{ErrorCategory::IO,
                                  "Unable to write input file.",
                                  "workspace_write_failed"};
        }

        LOG_DEBUG("[" + workspace.id + "] WorkspaceManager: acquired " +
                  workspace.root_dir.string());
        return workspace;
    }

    return TranspileError{ErrorCategory::IO,
                          "Unable to allocate unique workspace name.",
                          "workspace_name_exhausted"};
}

void WorkspaceManager::release(const Workspace& workspace) noexcept {
    try {
        if (!is_within_root(base_dir_, workspace.root_dir)) {
            LOG_ERROR("[" + workspace.id +
                      "] WorkspaceManager: refusing to remove path outside base dir: " +
                      workspace.root_dir.string());
            return;
        }

        std::error_code ec;
        const auto removed = std::filesystem::remove_all(workspace.root_dir, ec);
        if (ec) {
            LOG_WARN("[" + workspace.id + "] WorkspaceManager: cleanup of " +
                     workspace.root_dir.string() +
                     " failed: " + ec.message());
            return;
        }
        if (removed == 0) {
            LOG_DEBUG("[" + workspace.id + "] WorkspaceManager: " + workspace.root_dir.string() +
                      " already gone");
            return;
        }
        released_.fetch_add(1);
        LOG_DEBUG("[" + workspace.id + "] WorkspaceManager: released " +
                  workspace.root_dir.string());
    } catch (const std::exception& ex) {
        // remove_all can still throw bad_alloc; teardown must not propagate it.
        LOG_ERROR("[" + workspace.id + "] WorkspaceManager: release threw: " + ex.what());
    }
}

ScopedWorkspace::ScopedWorkspace(WorkspaceManager& manager, Workspace workspace)
    : manager_(manager), workspace_(std::move(workspace)) {}

ScopedWorkspace::~ScopedWorkspace() { manager_.release(workspace_); }

}  // namespace transpiler::session
