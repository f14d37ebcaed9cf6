#include "mcp/tool_catalog.hpp"

#include "languages/language_registry.hpp"

namespace transpiler::mcp {

using nlohmann::json;

namespace {

json transpile_schema() {
    json codes = json::array();
    std::string names;
    for (const auto& language : languages::supported_languages()) {
        codes.push_back(language.code);
        if (!names.empty()) {
            names += ", ";
        }
        names += language.display_name;
    }

    return json{{"type", "object"},
                {"properties",
                 {{"python_code",
                   {{"type", "string"}, {"description", "The Python code to transpile"}}},
                  {"target_language",
                   {{"type", "string"},
                    {"enum", codes},
                    {"description", "Target language. Supported: " + names}}}}},
                {"required", json::array({"python_code", "target_language"})}};
}

}  // namespace

const std::vector<ToolDescriptor>& tool_catalog() {
    static const std::vector<ToolDescriptor> catalog = {
        {"transpile_python",
         "Transpile Python code to another programming language using py2many. "
         "Use deterministic translation for simple, well-structured Python code. "
         "For complex code or when the deterministic translation fails, consider "
         "using the transpile_python_with_llm tool instead.",
         transpile_schema()},
        {"transpile_python_with_llm",
         "Transpile Python code to another language using py2many with LLM assistance. "
         "Use this for complex Python code, when dealing with language-specific idioms, "
         "or when the deterministic translation produces incorrect or non-idiomatic results.",
         transpile_schema()},
        {"list_supported_languages",
         "List all supported target languages for transpilation",
         json{{"type", "object"}, {"properties", json::object()}}},
        {"verify_python",
         "Verify Python code using SMT and the z3 solver. Transpiles the code with --smt "
         "and checks that the negated pre/post conditions are unsat. Returns "
         "counterexample if a bug is found, verified otherwise.",
         json{{"type", "object"},
              {"properties",
               {{"python_code",
                 {{"type", "string"}, {"description", "The Python code to verify"}}}}},
              {"required", json::array({"python_code"})}}}};
    return catalog;
}

}  // namespace transpiler::mcp
