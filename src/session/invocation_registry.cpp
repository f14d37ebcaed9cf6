#include "session/invocation_registry.hpp"
#include <utility>
#include "core/logging/logger.hpp"

namespace transpiler::session {

using core::errors::ErrorCategory;
using core::errors::TranspileError;

std::string InvocationRegistry::to_string(const InvocationState state) {
    switch (state) {
        case InvocationState::Running:
            return "running";
        case InvocationState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> InvocationRegistry::begin(
    const std::string& request_key, const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (invocations_.find(request_key) != invocations_.end()) {
        return TranspileError{ErrorCategory::Input,
                              "Request id already in flight: " + request_key,
                              "duplicate_request_id"};
    }

    InvocationRecord record;
    record.request_key = request_key;
    record.tool_name = tool_name;
    record.state = InvocationState::Running;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto token = record.cancel_token;
    invocations_.emplace(request_key, std::move(record));
    LOG_DEBUG("InvocationRegistry: " + request_key + " (" + tool_name + ") running");
    return token;
}

core::errors::Result<InvocationState> InvocationRegistry::cancel(
    const std::string& request_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(request_key);
    if (it == invocations_.end()) {
        return TranspileError{ErrorCategory::Input,
                              "Request id not in flight: " + request_key,
                              "invocation_not_found"};
    }
    if (it->second.state == InvocationState::Cancelled) {
        return TranspileError{ErrorCategory::Input,
                              "Invocation is already " + to_string(it->second.state),
                              "invalid_state_transition"};
    }

    it->second.state = InvocationState::Cancelled;
    it->second.cancel_token->store(true);
    LOG_INFO("InvocationRegistry: " + request_key + " transition running -> cancelled");
    return it->second.state;
}

core::errors::Result<InvocationState> InvocationRegistry::get_state(
    const std::string& request_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invocations_.find(request_key);
    if (it == invocations_.end()) {
        return TranspileError{ErrorCategory::Input,
                              "Request id not in flight: " + request_key,
                              "invocation_not_found"};
    }
    return it->second.state;
}

void InvocationRegistry::finish(const std::string& request_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    invocations_.erase(request_key);
}

std::size_t InvocationRegistry::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t cancelled = 0;
    for (auto& entry : invocations_) {
        if (entry.second.state == InvocationState::Running) {
            entry.second.state = InvocationState::Cancelled;
            entry.second.cancel_token->store(true);
            ++cancelled;
        }
    }
    return cancelled;
}

std::size_t InvocationRegistry::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invocations_.size();
}

}  // namespace transpiler::session
