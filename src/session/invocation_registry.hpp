#pragma once

#include <cstddef>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "core/errors/transpile_errors.hpp"

namespace transpiler::session {

enum class InvocationState {
    Running,
    Cancelled
};

struct InvocationRecord {
    std::string request_key;
    std::string tool_name;
    InvocationState state = InvocationState::Running;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// In-flight tool calls keyed by their JSON-RPC request id, so the protocol
// layer can cancel one. Entries exist from begin() until finish().
class InvocationRegistry {
public:
    core::errors::Result<std::shared_ptr<std::atomic_bool>> begin(
        const std::string& request_key, const std::string& tool_name);
    core::errors::Result<InvocationState> cancel(const std::string& request_key);
    core::errors::Result<InvocationState> get_state(const std::string& request_key) const;
    void finish(const std::string& request_key);

    // Used at shutdown: flips every outstanding cancel token.
    std::size_t cancel_all();
    std::size_t in_flight_count() const;

private:
    static std::string to_string(InvocationState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, InvocationRecord> invocations_;
};

}  // namespace transpiler::session
