#include "mcptools/tools/registry.hpp"

#include "mcptools/core/logger.hpp"

namespace mcptools::tools {

auto ToolRegistry::register_tool(ToolDescriptor descriptor) -> VoidResult {
    if (sealed_) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Registry is sealed", descriptor.name));
    }
    if (descriptor.name.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Tool name must not be empty"));
    }
    if (index_.contains(descriptor.name)) {
        LOG_WARN("Duplicate tool registration rejected: {}", descriptor.name);
        return std::unexpected(make_error(
            ErrorCode::DuplicateName,
            "Tool already registered", descriptor.name));
    }

    LOG_INFO("Registered tool: {}{}", descriptor.name,
             descriptor.is_async() ? " (async)" : "");

    index_.emplace(descriptor.name, tools_.size());
    tools_.push_back(std::move(descriptor));
    return {};
}

auto ToolRegistry::get(std::string_view name) const -> const ToolDescriptor* {
    auto it = index_.find(std::string(name));
    if (it != index_.end()) {
        return &tools_[it->second];
    }
    return nullptr;
}

auto ToolRegistry::list() const -> const std::vector<ToolDescriptor>& {
    return tools_;
}

auto ToolRegistry::to_json() const -> json {
    json result = json::array();
    for (const auto& tool : tools_) {
        result.push_back(tool.to_json());
    }
    return result;
}

auto ToolRegistry::size() const noexcept -> std::size_t {
    return tools_.size();
}

auto ToolRegistry::contains(std::string_view name) const -> bool {
    return index_.contains(std::string(name));
}

} // namespace mcptools::tools
