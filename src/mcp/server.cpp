#include "mcp/server.hpp"

#include <exception>
#include <istream>
#include <ostream>
#include <system_error>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"
#include "mcp/tool_catalog.hpp"

namespace transpiler::mcp {

using nlohmann::json;

namespace {

constexpr const char* kServerName = "transpiler-mcp";
constexpr const char* kServerVersion = "0.1.0";
constexpr const char* kProtocolVersion = "2024-11-05";

std::string request_key(const json& id) { return id.dump(); }

}  // namespace

json to_call_result(const protocol::ToolResponse& response) {
    json result{{"content", json::array({json{{"type", "text"}, {"text", response.text}}})},
                {"isError", response.is_error}};
    if (!response.structured.is_null()) {
        result["structuredContent"] = response.structured;
    }
    return result;
}

Server::Server(runtime::ToolDispatcher& dispatcher, session::InvocationRegistry& registry)
    : dispatcher_(dispatcher), registry_(registry) {}

Server::~Server() {
    registry_.cancel_all();
    reap_workers(true);
}

int Server::run(std::istream& in, std::ostream& out) {
    out_ = &out;
    LOG_INFO("Server: listening on stdio");

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }

        json message;
        try {
            message = json::parse(line);
        } catch (const json::parse_error& ex) {
            LOG_WARN(std::string("Server: unparseable message: ") + ex.what());
            write_message(make_error_response(nullptr, JsonRpcError{kParseError, "parse error"}));
            continue;
        }

        try {
            const auto response = handle_message(message);
            if (response.has_value()) {
                write_message(*response);
            }
        } catch (const std::exception& ex) {
            LOG_ERROR(std::string("Server: failed to process request: ") + ex.what());
            const json id = message.is_object() && message.contains("id") ? message["id"] : json();
            write_message(make_error_response(id, JsonRpcError{kInternalError, "internal error"}));
        }
        reap_workers(false);
    }

    const auto cancelled = registry_.cancel_all();
    if (cancelled > 0) {
        LOG_INFO("Server: input closed, cancelled " + std::to_string(cancelled) +
                 " in-flight call(s)");
    }
    reap_workers(true);
    LOG_INFO("Server: shut down");
    return 0;
}

std::optional<json> Server::handle_message(const json& message) {
    auto parsed = parse_request(message);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        return make_error_response(nullptr, JsonRpcError{kInvalidRequest, err.message});
    }
    const auto& request = core::errors::get_value(parsed);

    if (!request.id.has_value()) {
        if (request.method == "notifications/cancelled") {
            handle_cancelled(request.params);
        } else {
            LOG_DEBUG("Server: notification " + request.method);
        }
        return std::nullopt;
    }

    const json& id = *request.id;
    if (request.method == "initialize") {
        return make_result_response(id, handle_initialize(request.params));
    }
    if (request.method == "ping") {
        return make_result_response(id, json::object());
    }
    if (request.method == "tools/list") {
        return make_result_response(id, handle_tools_list());
    }
    if (request.method == "tools/call") {
        return handle_tools_call(id, request.params);
    }

    return make_error_response(id, JsonRpcError{kMethodNotFound, "method not found"});
}

json Server::handle_initialize(const json& params) const {
    std::string version = kProtocolVersion;
    if (params.is_object()) {
        const auto it = params.find("protocolVersion");
        if (it != params.end() && it->is_string()) {
            version = it->get<std::string>();
        }
    }
    return json{{"protocolVersion", version},
                {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
                {"capabilities", {{"tools", json::object()}}}};
}

json Server::handle_tools_list() const {
    json tools = json::array();
    for (const auto& tool : tool_catalog()) {
        tools.push_back(json{{"name", tool.name},
                             {"description", tool.description},
                             {"inputSchema", tool.input_schema}});
    }
    return json{{"tools", tools}};
}

std::optional<json> Server::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object()) {
        return make_error_response(id, JsonRpcError{kInvalidParams, "params must be an object"});
    }
    const auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return make_error_response(id, JsonRpcError{kInvalidParams, "name must be a string"});
    }
    json arguments = json::object();
    const auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        arguments = *args_it;
    }

    const std::string name = name_it->get<std::string>();
    auto parsed = runtime::parse_tool_call(name, arguments);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        if (err.category == core::errors::ErrorCategory::UnknownTool) {
            return make_error_response(id, JsonRpcError{kInvalidParams, err.message});
        }
        return make_result_response(id, to_call_result(runtime::make_error_response(err)));
    }
    const protocol::ToolRequest tool_request = core::errors::get_value(parsed);

    if (tool_request.tool == protocol::ToolKind::ListLanguages) {
        return make_result_response(id, to_call_result(dispatcher_.handle(tool_request)));
    }

    const std::string key = request_key(id);
    auto begun = registry_.begin(key, name);
    if (core::errors::is_error(begun)) {
        return make_error_response(
            id, JsonRpcError{kInvalidRequest, core::errors::get_error(begun).message});
    }
    auto cancel_token = core::errors::get_value(begun);

    Worker worker;
    worker.done = std::make_shared<std::atomic_bool>(false);
    auto done = worker.done;
    try {
        worker.thread = std::thread([this, id, key, tool_request, cancel_token, done]() {
            json response;
            try {
                const auto result = dispatcher_.handle(tool_request, cancel_token);
                response = make_result_response(id, to_call_result(result));
            } catch (const std::exception& ex) {
                LOG_ERROR("Server: worker for " + key + " failed: " + ex.what());
                response = make_error_response(id, JsonRpcError{kInternalError, "internal error"});
            } catch (...) {
                LOG_ERROR("Server: worker for " + key + " failed with a non-standard exception");
                response = make_error_response(id, JsonRpcError{kInternalError, "internal error"});
            }
            registry_.finish(key);
            try {
                write_message(response);
            } catch (const std::exception& ex) {
                LOG_ERROR("Server: cannot write response for " + key + ": " + ex.what());
            } catch (...) {
                LOG_ERROR("Server: cannot write response for " + key);
            }
            done->store(true);
        });
    } catch (const std::system_error& ex) {
        registry_.finish(key);
        LOG_ERROR(std::string("Server: cannot start worker: ") + ex.what());
        return make_error_response(id, JsonRpcError{kInternalError, "internal error"});
    }
    workers_.push_back(std::move(worker));
    return std::nullopt;
}

void Server::handle_cancelled(const json& params) {
    if (!params.is_object()) {
        return;
    }
    const auto it = params.find("requestId");
    if (it == params.end()) {
        return;
    }
    auto cancelled = registry_.cancel(request_key(*it));
    if (core::errors::is_error(cancelled)) {
        LOG_DEBUG("Server: cancel ignored: " + core::errors::get_error(cancelled).message);
    }
}

void Server::write_message(const json& message) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (out_ == nullptr) {
        return;
    }
    *out_ << message.dump() << '\n';
    out_->flush();
}

void Server::reap_workers(const bool wait_all) {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace transpiler::mcp
