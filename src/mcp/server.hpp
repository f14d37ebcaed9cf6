#pragma once

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/jsonrpc.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/tool_dispatcher.hpp"
#include "session/invocation_registry.hpp"

namespace transpiler::mcp {

// Converts a dispatcher response into an MCP tools/call result object.
nlohmann::json to_call_result(const protocol::ToolResponse& response);

// Line-delimited JSON-RPC over a stream pair. tools/call requests run on
// their own worker thread; everything else is answered inline.
class Server {
public:
    Server(runtime::ToolDispatcher& dispatcher, session::InvocationRegistry& registry);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Returns once `in` hits EOF and every worker has finished.
    int run(std::istream& in, std::ostream& out);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    std::optional<nlohmann::json> handle_message(const nlohmann::json& message);
    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_list() const;
    std::optional<nlohmann::json> handle_tools_call(const nlohmann::json& id,
                                                    const nlohmann::json& params);
    void handle_cancelled(const nlohmann::json& params);

    void write_message(const nlohmann::json& message);
    void reap_workers(bool wait_all);

    runtime::ToolDispatcher& dispatcher_;
    session::InvocationRegistry& registry_;
    std::ostream* out_ = nullptr;
    std::mutex out_mutex_;
    std::vector<Worker> workers_;
};

}  // namespace transpiler::mcp
