#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/transpile_errors.hpp"
#include "protocol/invocation_outcome.hpp"

namespace transpiler::tools {

struct ProcessSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 60000;
    // time between SIGTERM and SIGKILL once the run is being stopped
    std::uint32_t grace_ms = 2000;
    std::size_t max_stdout_bytes = 8 * 1024 * 1024;
    std::size_t max_stderr_bytes = 64 * 1024;
    std::shared_ptr<std::atomic_bool> cancel_token;
    // prefixed to every log line, normally the invocation id
    std::string log_label;
};

// Executes argv directly (no shell) in its own process group with stdin on
// /dev/null. Only spawn failures are errors; timeouts, cancellation and
// non-zero exits are reported in the RawOutcome.
core::errors::Result<protocol::RawOutcome> run_process(const ProcessSpec& spec);

}  // namespace transpiler::tools
