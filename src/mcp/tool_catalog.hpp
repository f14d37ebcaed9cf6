#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace transpiler::mcp {

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// Tools advertised by tools/list, in display order.
const std::vector<ToolDescriptor>& tool_catalog();

}  // namespace transpiler::mcp
