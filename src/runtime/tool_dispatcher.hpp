#pragma once

#include <atomic>
#include <memory>
#include <exception>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/errors/transpile_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/invocation_outcome.hpp"
#include "protocol/tool_contract.hpp"
#include "session/workspace_manager.hpp"
#include "tools/process_invoker.hpp"

namespace transpiler::runtime {

// Maps a protocol tool name and its arguments object to a ToolRequest.
core::errors::Result<protocol::ToolRequest> parse_tool_call(
    const std::string& name, const nlohmann::json& arguments);

// Builds the caller-facing error shape. Internal errors never carry detail.
protocol::ToolResponse make_error_response(const core::errors::TranspileError& error);

// Runs fn and turns anything it throws into an opaque InternalError response.
template <typename Fn>
protocol::ToolResponse guard_tool_call(const std::string& context, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& ex) {
        LOG_ERROR(context + " raised: " + ex.what());
        return make_error_response(core::errors::TranspileError{
            core::errors::ErrorCategory::Internal, ex.what(), "unexpected_exception"});
    } catch (...) {
        LOG_ERROR(context + " raised a non-standard exception");
        return make_error_response(core::errors::TranspileError{
            core::errors::ErrorCategory::Internal, "non-standard exception",
            "unexpected_exception"});
    }
}

class ToolDispatcher {
public:
    explicit ToolDispatcher(const core::config::ServerConfig& config);

    // Never throws: every failure comes back as an error ToolResponse.
    protocol::ToolResponse handle(
        const protocol::ToolRequest& request,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    session::WorkspaceManager& workspaces() { return workspaces_; }

private:
    protocol::ToolResponse list_languages() const;
    protocol::ToolResponse transpile(const protocol::ToolRequest& request,
                                     std::shared_ptr<std::atomic_bool> cancel_token);
    protocol::ToolResponse verify(const protocol::ToolRequest& request,
                                  std::shared_ptr<std::atomic_bool> cancel_token);
    // Which external process produced an outcome; only verify runs the solver.
    enum class Stage { Transpiler, Solver };

    protocol::ToolResponse format_outcome(const session::Workspace& workspace,
                                          const protocol::InvocationOutcome& outcome,
                                          Stage stage = Stage::Transpiler) const;

    session::WorkspaceManager workspaces_;
    tools::ProcessInvoker invoker_;
    std::size_t excerpt_limit_;
};

}  // namespace transpiler::runtime
