#include <catch2/catch_test_macros.hpp>

#include "mcptools/tools/registry.hpp"

using namespace mcptools;
using namespace mcptools::tools;

namespace {

auto make_echo_tool(std::string name) -> ToolDescriptor {
    return ToolDescriptor{
        .name = std::move(name),
        .description = "Echo the message back",
        .parameters = {.fields = {
            {.name = "message", .kind = schema::FieldKind::String,
             .description = "Text to echo"},
        }},
        .handler = SyncHandler{[](const json& args) -> Result<ToolOutput> {
            return ToolOutput{.content = args.at("message")};
        }},
    };
}

auto make_noop_async_tool(std::string name) -> ToolDescriptor {
    return ToolDescriptor{
        .name = std::move(name),
        .description = "Does nothing, slowly",
        .handler = AsyncHandler{[](const json&, tasks::TaskContext&) -> Result<json> {
            return json::object();
        }},
    };
}

} // anonymous namespace

TEST_CASE("ToolRegistry registration and lookup", "[tools][registry]") {
    ToolRegistry registry;

    REQUIRE(registry.register_tool(make_echo_tool("echo")).has_value());
    REQUIRE(registry.register_tool(make_noop_async_tool("slow")).has_value());

    SECTION("lookup by exact name") {
        const auto* tool = registry.get("echo");
        REQUIRE(tool != nullptr);
        CHECK(tool->name == "echo");
        CHECK_FALSE(tool->is_async());
        CHECK(registry.get("slow")->is_async());
    }

    SECTION("lookup is case sensitive") {
        CHECK(registry.get("Echo") == nullptr);
        CHECK_FALSE(registry.contains("ECHO"));
    }

    SECTION("unknown name") {
        CHECK(registry.get("missing") == nullptr);
    }

    SECTION("size and order") {
        CHECK(registry.size() == 2);
        REQUIRE(registry.list().size() == 2);
        CHECK(registry.list()[0].name == "echo");
        CHECK(registry.list()[1].name == "slow");
    }
}

TEST_CASE("ToolRegistry rejects invalid registrations", "[tools][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.register_tool(make_echo_tool("echo")).has_value());

    SECTION("duplicate name") {
        auto result = registry.register_tool(make_echo_tool("echo"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::DuplicateName);
        CHECK(result.error().detail() == "echo");
        CHECK(registry.size() == 1);
    }

    SECTION("empty name") {
        auto result = registry.register_tool(make_echo_tool(""));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("sealed registry") {
        registry.seal();
        CHECK(registry.sealed());
        auto result = registry.register_tool(make_echo_tool("other"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
        CHECK(registry.get("echo") != nullptr);
    }
}

TEST_CASE("ToolRegistry discovery JSON", "[tools][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.register_tool(make_echo_tool("echo")).has_value());
    REQUIRE(registry.register_tool(make_noop_async_tool("slow")).has_value());

    auto j = registry.to_json();
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);

    CHECK(j[0]["name"] == "echo");
    CHECK(j[0]["description"] == "Echo the message back");
    CHECK(j[0]["inputSchema"]["type"] == "object");
    CHECK(j[0]["inputSchema"]["properties"]["message"]["type"] == "string");
    CHECK(j[0]["inputSchema"]["required"][0] == "message");

    CHECK(j[1]["name"] == "slow");
    CHECK(j[1]["inputSchema"]["properties"].empty());
    CHECK_FALSE(j[1]["inputSchema"].contains("required"));
}
