#include "mcp/jsonrpc.hpp"

namespace transpiler::mcp {

using core::errors::ErrorCategory;
using core::errors::TranspileError;

namespace {

bool is_valid_id(const nlohmann::json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer() ||
           id.is_number_unsigned();
}

}  // namespace

core::errors::Result<JsonRpcRequest> parse_request(const nlohmann::json& message) {
    if (!message.is_object()) {
        return TranspileError{ErrorCategory::Input, "Request must be a JSON object",
                              "invalid_request"};
    }

    const auto jsonrpc_it = message.find("jsonrpc");
    if (jsonrpc_it == message.end() || !jsonrpc_it->is_string() ||
        *jsonrpc_it != kJsonRpcVersion) {
        return TranspileError{ErrorCategory::Input, "jsonrpc must be \"2.0\"",
                              "invalid_request"};
    }

    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return TranspileError{ErrorCategory::Input, "method must be a string",
                              "invalid_request"};
    }

    JsonRpcRequest parsed;
    parsed.method = method_it->get<std::string>();

    const auto params_it = message.find("params");
    if (params_it != message.end()) {
        if (!params_it->is_object() && !params_it->is_array()) {
            return TranspileError{ErrorCategory::Input,
                                  "params must be an object or an array",
                                  "invalid_request"};
        }
        parsed.params = *params_it;
    }

    const auto id_it = message.find("id");
    if (id_it != message.end()) {
        if (!is_valid_id(*id_it)) {
            return TranspileError{ErrorCategory::Input,
                                  "id must be string, integer, or null",
                                  "invalid_request"};
        }
        parsed.id = *id_it;
    }

    return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
    return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
    return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                          {"id", id},
                          {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace transpiler::mcp
