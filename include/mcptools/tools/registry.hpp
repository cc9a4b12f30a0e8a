#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "mcptools/core/error.hpp"
#include "mcptools/tools/tool.hpp"

namespace mcptools::tools {

/// Registry that holds all tools exposed by the server.
///
/// Tools are registered during startup composition, then the registry is
/// sealed. After seal() it is read-only, so concurrent lookups need no
/// locking. Listing follows registration order.
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    /// Register a tool. Fails with DuplicateName if the name is taken, and
    /// with InvalidArgument for an empty name or a sealed registry.
    auto register_tool(ToolDescriptor descriptor) -> VoidResult;

    /// Look up a tool by exact name. Returns nullptr if not found.
    [[nodiscard]] auto get(std::string_view name) const -> const ToolDescriptor*;

    /// All tools, in registration order.
    [[nodiscard]] auto list() const -> const std::vector<ToolDescriptor>&;

    /// Discovery JSON for every tool, in registration order.
    [[nodiscard]] auto to_json() const -> json;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// End the composition phase.
    void seal() noexcept { sealed_ = true; }
    [[nodiscard]] auto sealed() const noexcept -> bool { return sealed_; }

private:
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> index_;
    bool sealed_ = false;
};

} // namespace mcptools::tools
