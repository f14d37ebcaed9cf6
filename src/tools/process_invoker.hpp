#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/config/server_config.hpp"
#include "core/errors/transpile_errors.hpp"
#include "protocol/invocation_outcome.hpp"
#include "protocol/tool_contract.hpp"
#include "session/workspace_manager.hpp"

namespace transpiler::tools {

// Transpiler flags for (tool, language, input). Every piece stays a separate
// argv entry; nothing here is ever handed to a shell.
std::vector<std::string> build_arguments(protocol::ToolKind tool,
                                         const std::string& language_code,
                                         const std::filesystem::path& input_file);

class ProcessInvoker {
public:
    explicit ProcessInvoker(const core::config::ServerConfig& config);

    core::errors::Result<protocol::RawOutcome> run(
        const session::Workspace& workspace, protocol::ToolKind tool,
        const std::string& language_code,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    // Runs the configured solver on a query file inside the workspace.
    core::errors::Result<protocol::RawOutcome> run_solver(
        const session::Workspace& workspace, const std::filesystem::path& query_file,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

private:
    std::vector<std::string> transpiler_command_;
    std::vector<std::string> solver_command_;
    std::uint32_t timeout_ms_;
    std::uint32_t grace_ms_;
    std::size_t max_stdout_bytes_;
    std::size_t max_stderr_bytes_;
};

}  // namespace transpiler::tools
