#include "mcptools/tools/tool.hpp"

namespace mcptools::tools {

auto ToolDescriptor::to_json() const -> json {
    json j;
    j["name"] = name;
    j["description"] = description;
    j["inputSchema"] = parameters.to_json();
    return j;
}

} // namespace mcptools::tools
