#pragma once
#include <string>
#include <vector>
#include "core/config/server_config.hpp"
#include "core/errors/transpile_errors.hpp"

namespace transpiler::app::cli {
    // Defaults, then TRANSPILER_MCP_* environment variables, then flags.
    transpiler::core::errors::Result<transpiler::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);

    // Whitespace split honouring '...' and "..." quoting. Empty on unbalanced quotes.
    std::vector<std::string> split_command(const std::string& text);

    std::string usage();
}
