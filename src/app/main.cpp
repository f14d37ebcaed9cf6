#include <csignal>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/errors/transpile_errors.hpp"
#include "core/logging/logger.hpp"
#include "mcp/server.hpp"
#include "runtime/tool_dispatcher.hpp"
#include "session/invocation_registry.hpp"

int main(int argc, char* argv[]) {
    // 1. Resolve configuration once; it is read-only from here on
    auto parsed = transpiler::app::cli::parse_and_validate(argc, argv);
    if (transpiler::core::errors::is_error(parsed)) {
        const auto& err = transpiler::core::errors::get_error(parsed);
        if (err.code == "help_requested") {
            std::cerr << err.hint << std::endl;
            return 0;
        }
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = transpiler::core::errors::get_value(parsed);

    // 2. Logging goes to stderr; stdout belongs to the protocol
    transpiler::core::logging::Logger::get().set_min_level(config.log_level);

    // A client closing its end mid-write must not kill the server.
    std::signal(SIGPIPE, SIG_IGN);

    std::string command;
    for (const auto& part : config.transpiler_command) {
        command += (command.empty() ? "" : " ") + part;
    }
    // 3. Serve until stdin closes
    transpiler::runtime::ToolDispatcher dispatcher(config);
    LOG_INFO("Bootstrapping: transpiler='" + command + "' timeout=" +
             std::to_string(config.timeout_ms) + "ms workspace_root=" +
             dispatcher.workspaces().base_dir().string());
    transpiler::session::InvocationRegistry registry;
    transpiler::mcp::Server server(dispatcher, registry);
    const int rc = server.run(std::cin, std::cout);

    if (dispatcher.workspaces().acquired_count() != dispatcher.workspaces().released_count()) {
        LOG_WARN("Workspaces acquired=" +
                 std::to_string(dispatcher.workspaces().acquired_count()) + " released=" +
                 std::to_string(dispatcher.workspaces().released_count()));
    }
    return rc;
}
