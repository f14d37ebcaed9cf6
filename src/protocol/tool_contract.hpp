#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace transpiler::protocol {

    enum class ToolKind {
        Transpile,
        TranspileWithLlm,
        ListLanguages,
        Verify
    };

    // A validated tool call. Built once per incoming protocol call.
    struct ToolRequest {
        ToolKind tool = ToolKind::ListLanguages;
        std::string source_text;
        std::string target_language;
    };

    // What the dispatcher hands back to the protocol layer
    struct ToolResponse {
        bool is_error = false;
        std::string text;            // human readable content block
        nlohmann::json structured;   // {code} / {languages} / {verdict} or {error, message}
    };

    inline std::string to_string(const ToolKind tool) {
        switch (tool) {
            case ToolKind::Transpile:
                return "transpile_python";
            case ToolKind::TranspileWithLlm:
                return "transpile_python_with_llm";
            case ToolKind::ListLanguages:
                return "list_supported_languages";
            case ToolKind::Verify:
                return "verify_python";
            default:
                return "unknown";
        }
    }

} // namespace transpiler::protocol
