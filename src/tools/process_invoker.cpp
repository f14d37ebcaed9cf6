#include "tools/process_invoker.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/process_runner.hpp"

namespace transpiler::tools {

using core::errors::ErrorCategory;
using core::errors::TranspileError;
using protocol::RawOutcome;
using protocol::ToolKind;

std::vector<std::string> build_arguments(const ToolKind tool,
                                         const std::string& language_code,
                                         const std::filesystem::path& input_file) {
    std::vector<std::string> args;
    switch (tool) {
        case ToolKind::Transpile:
            args.push_back("--" + language_code);
            break;
        case ToolKind::TranspileWithLlm:
            args.push_back("--" + language_code);
            args.push_back("--llm");
            break;
        case ToolKind::Verify:
            args.push_back("--smt");
            break;
        case ToolKind::ListLanguages:
            return args;
    }
    args.push_back(input_file.string());
    return args;
}

ProcessInvoker::ProcessInvoker(const core::config::ServerConfig& config)
    : transpiler_command_(config.transpiler_command),
      solver_command_(config.solver_command),
      timeout_ms_(config.timeout_ms),
      grace_ms_(config.grace_ms),
      max_stdout_bytes_(config.max_stdout_bytes),
      max_stderr_bytes_(config.max_stderr_bytes) {}

core::errors::Result<RawOutcome> ProcessInvoker::run(
    const session::Workspace& workspace, const ToolKind tool,
    const std::string& language_code,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    if (tool == ToolKind::ListLanguages) {
        return TranspileError{ErrorCategory::Internal,
                              "list_supported_languages does not spawn a process.",
                              "no_process_for_tool"};
    }
    if (transpiler_command_.empty()) {
        return TranspileError{ErrorCategory::Internal,
                              "Transpiler command is not configured.",
                              "transpiler_not_configured"};
    }

    ProcessSpec spec;
    spec.argv = transpiler_command_;
    const auto args = build_arguments(tool, language_code, workspace.input_file);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.working_directory = workspace.root_dir;
    spec.timeout_ms = timeout_ms_;
    spec.grace_ms = grace_ms_;
    spec.max_stdout_bytes = max_stdout_bytes_;
    spec.max_stderr_bytes = max_stderr_bytes_;
    spec.cancel_token = std::move(cancel_token);
    spec.log_label = workspace.id;

    LOG_INFO("[" + workspace.id + "] ProcessInvoker: " + protocol::to_string(tool) +
             " target=" + (language_code.empty() ? "-" : language_code));
    return run_process(spec);
}

core::errors::Result<RawOutcome> ProcessInvoker::run_solver(
    const session::Workspace& workspace, const std::filesystem::path& query_file,
    std::shared_ptr<std::atomic_bool> cancel_token) const {
    if (solver_command_.empty()) {
        return TranspileError{ErrorCategory::Internal,
                              "Solver command is not configured.",
                              "solver_not_configured"};
    }

    ProcessSpec spec;
    spec.argv = solver_command_;
    spec.argv.push_back(query_file.string());
    spec.working_directory = workspace.root_dir;
    spec.timeout_ms = timeout_ms_;
    spec.grace_ms = grace_ms_;
    spec.max_stdout_bytes = max_stdout_bytes_;
    spec.max_stderr_bytes = max_stderr_bytes_;
    spec.cancel_token = std::move(cancel_token);
    spec.log_label = workspace.id;

    LOG_INFO("[" + workspace.id + "] ProcessInvoker: solver on " +
             query_file.filename().string());
    return run_process(spec);
}

}  // namespace transpiler::tools
