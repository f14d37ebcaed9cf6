#include "tools/result_classifier.hpp"

namespace transpiler::tools {

using protocol::CancelledOutcome;
using protocol::InternalErrorOutcome;
using protocol::InvocationOutcome;
using protocol::RawOutcome;
using protocol::SuccessOutcome;
using protocol::TimeoutOutcome;
using protocol::ToolFailureOutcome;

std::string bound_excerpt(const std::string& text, const std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "\n... [truncated " +
           std::to_string(text.size() - limit) + " bytes]";
}

InvocationOutcome classify(const RawOutcome& raw, const std::size_t excerpt_limit) {
    if (raw.timed_out) {
        return TimeoutOutcome{raw.duration_ms};
    }
    if (raw.cancelled) {
        return CancelledOutcome{raw.duration_ms};
    }
    if (raw.exit_code == 0) {
        if (raw.stdout_text.empty()) {
            return InternalErrorOutcome{"tool produced no output"};
        }
        // Truncated code is never returned as a translation.
        if (raw.stdout_truncated) {
            return InternalErrorOutcome{"tool output exceeded capture limit"};
        }
        return SuccessOutcome{raw.stdout_text};
    }

    std::string excerpt = bound_excerpt(raw.stderr_text, excerpt_limit);
    if (raw.stderr_truncated && excerpt.size() == raw.stderr_text.size()) {
        excerpt += "\n... [truncated]";
    }
    return ToolFailureOutcome{excerpt, raw.exit_code};
}

}  // namespace transpiler::tools
