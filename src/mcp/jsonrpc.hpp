#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/transpile_errors.hpp"

namespace transpiler::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

struct JsonRpcError {
    int code;
    std::string message;
};

struct JsonRpcRequest {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
    std::optional<nlohmann::json> id;  // absent for notifications
};

core::errors::Result<JsonRpcRequest> parse_request(const nlohmann::json& message);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace transpiler::mcp
