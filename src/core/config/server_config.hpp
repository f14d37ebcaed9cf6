#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace transpiler::core::config {

    // Process-wide settings, read once at startup and never mutated afterwards.
    struct ServerConfig {
        // argv prefix for the transpiler; language flags and the input path follow it
        std::vector<std::string> transpiler_command = {"uvx", "py2many"};
        std::vector<std::string> solver_command = {"z3"};
        std::uint32_t timeout_ms = 60000;
        std::uint32_t grace_ms = 2000;
        // empty until the parser resolves it; falls back to the system temp dir
        std::filesystem::path workspace_root;
        std::size_t max_stdout_bytes = 8 * 1024 * 1024;
        std::size_t max_stderr_bytes = 64 * 1024;
        std::size_t excerpt_limit = 2000;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

} // namespace transpiler::core::config
