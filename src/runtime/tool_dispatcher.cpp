#include "runtime/tool_dispatcher.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "languages/language_registry.hpp"
#include "tools/result_classifier.hpp"
#include "tools/smt_verifier.hpp"

namespace transpiler::runtime {

using core::errors::ErrorCategory;
using core::errors::TranspileError;
using nlohmann::json;
using protocol::InvocationOutcome;
using protocol::RawOutcome;
using protocol::ToolKind;
using protocol::ToolRequest;
using protocol::ToolResponse;

namespace {

constexpr const char* kOpaqueInternalMessage =
    "Internal error while running the transpiler.";

std::string supported_codes() {
    std::string codes;
    for (const auto& language : languages::supported_languages()) {
        if (!codes.empty()) {
            codes += ", ";
        }
        codes += language.code;
    }
    return codes;
}

core::errors::Result<std::string> require_string(const json& arguments,
                                                 const char* key) {
    const auto it = arguments.find(key);
    if (it == arguments.end()) {
        return TranspileError{ErrorCategory::Input,
                              std::string("Missing required argument: ") + key,
                              "missing_argument"};
    }
    if (!it->is_string()) {
        return TranspileError{ErrorCategory::Input,
                              std::string("Argument must be a string: ") + key,
                              "invalid_argument_type"};
    }
    return it->get<std::string>();
}

ToolResponse error_response(const std::string& error, const std::string& message,
                            json extra = json::object()) {
    ToolResponse response;
    response.is_error = true;
    response.text = "Error: " + message;
    response.structured = std::move(extra);
    response.structured["error"] = error;
    response.structured["message"] = message;
    return response;
}

std::string format_seconds(const double elapsed_ms) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(1);
    out << elapsed_ms / 1000.0;
    return out.str();
}

core::errors::Result<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return TranspileError{ErrorCategory::IO, "Unable to open " + path.filename().string(),
                              "read_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return TranspileError{ErrorCategory::IO, "Unable to read " + path.filename().string(),
                              "read_failed"};
    }
    return buffer.str();
}

core::errors::Result<bool> write_text(const std::filesystem::path& path,
                                      const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return TranspileError{ErrorCategory::IO, "Unable to open " + path.filename().string(),
                              "write_open_failed"};
    }
    out << text;
    out.flush();
    if (!out.good()) {
        return TranspileError{ErrorCategory::IO, "Unable to write " + path.filename().string(),
                              "write_failed"};
    }
    return true;
}

bool stopped_early(const RawOutcome& raw) {
    return raw.timed_out || raw.cancelled || raw.exit_code != 0;
}

}  // namespace

core::errors::Result<ToolRequest> parse_tool_call(const std::string& name,
                                                  const json& arguments) {
    if (!arguments.is_object()) {
        return TranspileError{ErrorCategory::Input, "arguments must be an object",
                              "invalid_arguments"};
    }

    ToolRequest request;
    if (name == "list_supported_languages") {
        request.tool = ToolKind::ListLanguages;
        return request;
    }
    if (name == "transpile_python") {
        request.tool = ToolKind::Transpile;
    } else if (name == "transpile_python_with_llm") {
        request.tool = ToolKind::TranspileWithLlm;
    } else if (name == "verify_python") {
        request.tool = ToolKind::Verify;
    } else {
        return TranspileError{ErrorCategory::UnknownTool, "Unknown tool: " + name,
                              "unknown_tool"};
    }

    auto code = require_string(arguments, "python_code");
    if (core::errors::is_error(code)) {
        return core::errors::get_error(code);
    }
    request.source_text = core::errors::get_value(code);

    if (request.tool != ToolKind::Verify) {
        auto language = require_string(arguments, "target_language");
        if (core::errors::is_error(language)) {
            return core::errors::get_error(language);
        }
        request.target_language = core::errors::get_value(language);
    }
    return request;
}

ToolResponse make_error_response(const TranspileError& error) {
    if (error.category == ErrorCategory::Internal) {
        return error_response(core::errors::to_string(error.category),
                              kOpaqueInternalMessage);
    }
    std::string message = error.message;
    if (!error.hint.empty()) {
        message += " " + error.hint;
    }
    return error_response(core::errors::to_string(error.category), message);
}

ToolDispatcher::ToolDispatcher(const core::config::ServerConfig& config)
    : workspaces_(config.workspace_root),
      invoker_(config),
      excerpt_limit_(config.excerpt_limit) {}

ToolResponse ToolDispatcher::handle(const ToolRequest& request,
                                    std::shared_ptr<std::atomic_bool> cancel_token) {
    return guard_tool_call("ToolDispatcher: " + protocol::to_string(request.tool),
                           [&]() -> ToolResponse {
        switch (request.tool) {
            case ToolKind::ListLanguages:
                return list_languages();
            case ToolKind::Transpile:
            case ToolKind::TranspileWithLlm:
                return transpile(request, std::move(cancel_token));
            case ToolKind::Verify:
                return verify(request, std::move(cancel_token));
        }
        return make_error_response(TranspileError{ErrorCategory::UnknownTool,
                                                  "Unknown tool.", "unknown_tool"});
    });
}

ToolResponse ToolDispatcher::list_languages() const {
    json languages = json::array();
    std::string text = "Supported languages:\n";
    for (const auto& language : languages::supported_languages()) {
        languages.push_back(json{{"code", language.code},
                                  {"display_name", language.display_name},
                                  {"file_extension", language.file_extension}});
        text += "\n- " + language.code + ": " + language.display_name;
    }

    ToolResponse response;
    response.text = text;
    response.structured = json{{"languages", languages}};
    return response;
}

ToolResponse ToolDispatcher::transpile(const ToolRequest& request,
                                       std::shared_ptr<std::atomic_bool> cancel_token) {
    if (request.source_text.empty()) {
        return make_error_response(TranspileError{
            ErrorCategory::Input, "No Python code provided.", "empty_source"});
    }
    if (languages::find_language(request.target_language) == nullptr) {
        LOG_INFO("ToolDispatcher: rejected target '" + request.target_language + "'");
        return make_error_response(TranspileError{
            ErrorCategory::UnsupportedLanguage,
            "Unsupported target language '" + request.target_language + "'.",
            "unsupported_language", "Supported languages: " + supported_codes()});
    }

    auto acquired = workspaces_.acquire(request.source_text);
    if (core::errors::is_error(acquired)) {
        return make_error_response(core::errors::get_error(acquired));
    }
    const session::ScopedWorkspace scoped(workspaces_, core::errors::get_value(acquired));
    const auto& workspace = scoped.get();

    auto raw = invoker_.run(workspace, request.tool, request.target_language,
                            std::move(cancel_token));
    if (core::errors::is_error(raw)) {
        const auto& err = core::errors::get_error(raw);
        LOG_ERROR("[" + workspace.id + "] ToolDispatcher: spawn failed [" + err.code +
                  "]: " + err.message);
        return make_error_response(err);
    }

    return format_outcome(workspace,
                          tools::classify(core::errors::get_value(raw), excerpt_limit_));
}

ToolResponse ToolDispatcher::verify(const ToolRequest& request,
                                    std::shared_ptr<std::atomic_bool> cancel_token) {
    if (request.source_text.empty()) {
        return make_error_response(TranspileError{
            ErrorCategory::Input, "No Python code provided.", "empty_source"});
    }

    auto acquired = workspaces_.acquire(request.source_text);
    if (core::errors::is_error(acquired)) {
        return make_error_response(core::errors::get_error(acquired));
    }
    const session::ScopedWorkspace scoped(workspaces_, core::errors::get_value(acquired));
    const auto& workspace = scoped.get();

    auto transpiled = invoker_.run(workspace, ToolKind::Verify, "", cancel_token);
    if (core::errors::is_error(transpiled)) {
        const auto& err = core::errors::get_error(transpiled);
        LOG_ERROR("[" + workspace.id + "] ToolDispatcher: spawn failed [" + err.code +
                  "]: " + err.message);
        return make_error_response(err);
    }
    const RawOutcome& smt_run = core::errors::get_value(transpiled);
    // --smt writes its result next to the input, so empty stdout is fine here.
    if (stopped_early(smt_run)) {
        return format_outcome(workspace, tools::classify(smt_run, excerpt_limit_));
    }

    auto smt_path = workspace.input_file;
    smt_path.replace_extension(".smt");
    std::error_code ec;
    if (!std::filesystem::exists(smt_path, ec) || ec) {
        return error_response("ToolFailure", "SMT file was not generated.",
                              json{{"exit_code", smt_run.exit_code}});
    }

    auto smt_text = read_text(smt_path);
    if (core::errors::is_error(smt_text)) {
        return make_error_response(core::errors::get_error(smt_text));
    }
    const auto query = tools::build_verification_query(core::errors::get_value(smt_text));

    auto query_path = workspace.root_dir / "input_verify.smt";
    auto written = write_text(query_path, query.text);
    if (core::errors::is_error(written)) {
        return make_error_response(core::errors::get_error(written));
    }

    auto solved = invoker_.run_solver(workspace, query_path, std::move(cancel_token));
    if (core::errors::is_error(solved)) {
        const auto& err = core::errors::get_error(solved);
        LOG_ERROR("[" + workspace.id + "] ToolDispatcher: solver spawn failed [" +
                  err.code + "]: " + err.message);
        return make_error_response(err);
    }
    const RawOutcome& solver_run = core::errors::get_value(solved);
    if (solver_run.timed_out || solver_run.cancelled ||
        (solver_run.exit_code != 0 && solver_run.stdout_text.empty())) {
        return format_outcome(workspace, tools::classify(solver_run, excerpt_limit_),
                              Stage::Solver);
    }

    const auto verdict = tools::parse_solver_verdict(solver_run.stdout_text);
    std::string text = "=== transpiler --smt output ===\n" + smt_run.stdout_text +
                       "\n=== solver result ===\n" + solver_run.stdout_text;
    switch (verdict) {
        case tools::SolverVerdict::Verified:
            text += "\n=== VERIFICATION PASSED ===\n"
                    "UNSAT: no counterexample exists, the postcondition holds for every valid input.";
            break;
        case tools::SolverVerdict::Counterexample:
            text += "\n=== VERIFICATION FAILED ===\n"
                    "SAT: a counterexample exists that violates the postcondition.";
            break;
        case tools::SolverVerdict::Unknown:
            text += "\n=== UNKNOWN RESULT ===";
            break;
    }

    LOG_INFO("[" + workspace.id + "] ToolDispatcher: verdict " + tools::to_string(verdict));
    ToolResponse response;
    response.text = text;
    response.structured = json{{"verdict", tools::to_string(verdict)},
                               {"solver_output", solver_run.stdout_text},
                               {"used_precondition", query.used_precondition}};
    return response;
}

ToolResponse ToolDispatcher::format_outcome(const session::Workspace& workspace,
                                            const InvocationOutcome& outcome,
                                            const Stage stage) const {
    const bool solver = stage == Stage::Solver;
    const std::string process = solver ? "Solver" : "Transpiler";
    const std::string stage_name = solver ? "solver" : "transpiler";
    return std::visit(
        [&](const auto& value) -> ToolResponse {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, protocol::SuccessOutcome>) {
                LOG_INFO("[" + workspace.id + "] ToolDispatcher: success (" +
                         std::to_string(value.output_text.size()) + " bytes)");
                ToolResponse response;
                response.text = value.output_text;
                response.structured = json{{"code", value.output_text}};
                return response;
            } else if constexpr (std::is_same_v<T, protocol::ToolFailureOutcome>) {
                LOG_WARN("[" + workspace.id + "] ToolDispatcher: " + stage_name +
                         " failed with exit code " + std::to_string(value.exit_code));
                return error_response(
                    "ToolFailure",
                    process + " exited with code " + std::to_string(value.exit_code) +
                        (value.stderr_excerpt.empty() ? "." : ":\n" + value.stderr_excerpt),
                    json{{"exit_code", value.exit_code},
                         {"stderr", value.stderr_excerpt},
                         {"stage", stage_name}});
            } else if constexpr (std::is_same_v<T, protocol::TimeoutOutcome>) {
                LOG_WARN("[" + workspace.id + "] ToolDispatcher: " + stage_name + " timed out");
                return error_response(
                    "Timeout",
                    (solver ? "Solver run" : "Transpilation") + std::string(" timed out after ") +
                        format_seconds(value.elapsed_ms) + " seconds.",
                    json{{"elapsed_ms", value.elapsed_ms}, {"stage", stage_name}});
            } else if constexpr (std::is_same_v<T, protocol::CancelledOutcome>) {
                LOG_INFO("[" + workspace.id + "] ToolDispatcher: cancelled");
                return error_response("Cancelled", "Request was cancelled.",
                                      json{{"elapsed_ms", value.elapsed_ms}});
            } else {
                LOG_ERROR("[" + workspace.id + "] ToolDispatcher: " + stage_name +
                          " internal error: " + value.message);
                return error_response("InternalError", kOpaqueInternalMessage);
            }
        },
        outcome);
}

}  // namespace transpiler::runtime
