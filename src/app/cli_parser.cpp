#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>

namespace transpiler::app::cli {

    using namespace transpiler::core::errors;
    using transpiler::core::config::ServerConfig;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> transpiler;
        std::optional<std::string> solver;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> grace_ms;
        std::optional<std::string> workspace_root;
        std::optional<std::string> log_level;
    };

    std::optional<std::string> read_env(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    Result<std::uint32_t> parse_bounded(const std::string& text, const std::string& flag,
                                        std::uint32_t min, std::uint32_t max) {
        std::uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return TranspileError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
        }
        if (value < min || value > max) {
            return TranspileError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
        }
        return value;
    }

    } // namespace

    std::vector<std::string> split_command(const std::string& text) {
        std::vector<std::string> out;
        std::string current;
        bool has_token = false;
        char quote = '\0';
        for (const char c : text) {
            if (quote != '\0') {
                if (c == quote) {
                    quote = '\0';
                } else {
                    current.push_back(c);
                }
                continue;
            }
            if (c == '\'' || c == '"') {
                quote = c;
                has_token = true;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (has_token) {
                    out.push_back(current);
                    current.clear();
                    has_token = false;
                }
                continue;
            }
            current.push_back(c);
            has_token = true;
        }
        if (quote != '\0') {
            return {};
        }
        if (has_token) {
            out.push_back(current);
        }
        return out;
    }

    std::string usage() {
        return "Usage: transpiler_mcp_server [--transpiler CMD] [--solver CMD] [--timeout-ms N]\n"
               "                             [--grace-ms N] [--workspace-root DIR]\n"
               "                             [--log-level debug|info|warn|error]\n"
               "Environment: TRANSPILER_MCP_TRANSPILER, TRANSPILER_MCP_SOLVER,\n"
               "             TRANSPILER_MCP_TIMEOUT_MS, TRANSPILER_MCP_GRACE_MS,\n"
               "             TRANSPILER_MCP_WORKSPACE_ROOT, TRANSPILER_MCP_LOG_LEVEL";
    }

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        // 2. Environment layer
        RawCliOptions raw;
        raw.transpiler = read_env("TRANSPILER_MCP_TRANSPILER");
        raw.solver = read_env("TRANSPILER_MCP_SOLVER");
        raw.timeout_ms = read_env("TRANSPILER_MCP_TIMEOUT_MS");
        raw.grace_ms = read_env("TRANSPILER_MCP_GRACE_MS");
        raw.workspace_root = read_env("TRANSPILER_MCP_WORKSPACE_ROOT");
        raw.log_level = read_env("TRANSPILER_MCP_LOG_LEVEL");

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 3. Parser Phase: flags override the environment
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* target = nullptr;
            if (args[i] == "--transpiler") target = &raw.transpiler;
            else if (args[i] == "--solver") target = &raw.solver;
            else if (args[i] == "--timeout-ms") target = &raw.timeout_ms;
            else if (args[i] == "--grace-ms") target = &raw.grace_ms;
            else if (args[i] == "--workspace-root") target = &raw.workspace_root;
            else if (args[i] == "--log-level") target = &raw.log_level;
            else if (args[i] == "--help" || args[i] == "-h") {
                return TranspileError{ErrorCategory::Input, "Help requested.", "help_requested", usage()};
            } else {
                return TranspileError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }

            if (i + 1 < args.size()) *target = args[++i];
            else return TranspileError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
        }

        // 4. Validator Phase: Enforce logic and bounds
        ServerConfig config;

        if (raw.transpiler) {
            auto command = split_command(raw.transpiler.value());
            if (command.empty()) {
                return TranspileError{ErrorCategory::Input, "Transpiler command is empty or badly quoted", "invalid_command"};
            }
            config.transpiler_command = std::move(command);
        }
        if (raw.solver) {
            auto command = split_command(raw.solver.value());
            if (command.empty()) {
                return TranspileError{ErrorCategory::Input, "Solver command is empty or badly quoted", "invalid_command"};
            }
            config.solver_command = std::move(command);
        }

        if (raw.timeout_ms) {
            auto parsed = parse_bounded(raw.timeout_ms.value(), "--timeout-ms", 1, 3600000);
            if (is_error(parsed)) return get_error(parsed);
            config.timeout_ms = get_value(parsed);
        }
        if (raw.grace_ms) {
            auto parsed = parse_bounded(raw.grace_ms.value(), "--grace-ms", 0, 60000);
            if (is_error(parsed)) return get_error(parsed);
            config.grace_ms = get_value(parsed);
        }

        if (raw.log_level) {
            const auto level = transpiler::core::logging::parse_log_level(raw.log_level.value());
            if (!level) {
                return TranspileError{ErrorCategory::Input, "Invalid log level: " + raw.log_level.value(), "invalid_log_level",
                                      "Use one of debug, info, warn, error."};
            }
            config.log_level = *level;
        }

        // Path validation: the root may not exist yet, but must not be a file
        if (raw.workspace_root) {
            std::filesystem::path p(raw.workspace_root.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec) {
                return TranspileError{ErrorCategory::Input, "Workspace root cannot be inspected", "invalid_path"};
            }
            if (exists && !std::filesystem::is_directory(p, path_ec)) {
                return TranspileError{ErrorCategory::Input, "Workspace root is not a directory", "invalid_path"};
            }
            std::filesystem::path absolute_path = std::filesystem::absolute(p, path_ec);
            if (path_ec) {
                return TranspileError{ErrorCategory::Input, "Failed to resolve workspace root", "invalid_path"};
            }
            config.workspace_root = absolute_path.lexically_normal();
        } else {
            std::error_code tmp_ec;
            const auto tmp = std::filesystem::temp_directory_path(tmp_ec);
            if (tmp_ec) {
                return TranspileError{ErrorCategory::Input, "System temp directory is unusable: " + tmp_ec.message(), "invalid_path",
                                      "Set --workspace-root or TRANSPILER_MCP_WORKSPACE_ROOT."};
            }
            config.workspace_root = tmp;
        }

        return config;
    }

} // namespace transpiler::app::cli
