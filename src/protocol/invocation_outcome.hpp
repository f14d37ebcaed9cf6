#pragma once

#include <string>
#include <variant>

namespace transpiler::protocol {

// What the process runner observed, before any interpretation.
struct RawOutcome {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    double duration_ms = 0.0;
};

struct SuccessOutcome {
    std::string output_text;
};

struct ToolFailureOutcome {
    std::string stderr_excerpt;
    int exit_code = -1;
};

struct TimeoutOutcome {
    double elapsed_ms = 0.0;
};

struct InternalErrorOutcome {
    std::string message;
};

struct CancelledOutcome {
    double elapsed_ms = 0.0;
};

using InvocationOutcome = std::variant<SuccessOutcome,
                                       ToolFailureOutcome,
                                       TimeoutOutcome,
                                       InternalErrorOutcome,
                                       CancelledOutcome>;

}  // namespace transpiler::protocol
