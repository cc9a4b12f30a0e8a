#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <memory>

#include "mcptools/protocol/server.hpp"

using namespace mcptools;
using namespace mcptools::protocol;
using namespace std::chrono_literals;

namespace {

struct ServerFixture {
    tools::ToolRegistry registry;
    tasks::TaskManager task_manager{2, 1s};
    std::shared_ptr<std::promise<void>> release = std::make_shared<std::promise<void>>();

    ServerFixture() {
        auto gate = release->get_future().share();

        REQUIRE(registry.register_tool(tools::ToolDescriptor{
            .name = "sum",
            .description = "Add two numbers",
            .parameters = {.fields = {
                {.name = "a", .kind = schema::FieldKind::Integer},
                {.name = "b", .kind = schema::FieldKind::Integer},
            }},
            .handler = tools::SyncHandler{[](const json& args) -> Result<tools::ToolOutput> {
                return tools::ToolOutput{.content = args["a"].get<int>() + args["b"].get<int>()};
            }},
        }).has_value());

        REQUIRE(registry.register_tool(tools::ToolDescriptor{
            .name = "fail",
            .description = "Always fails",
            .handler = tools::SyncHandler{[](const json&) -> Result<tools::ToolOutput> {
                return std::unexpected(make_error(ErrorCode::IoError, "disk on fire"));
            }},
        }).has_value());

        REQUIRE(registry.register_tool(tools::ToolDescriptor{
            .name = "reject",
            .description = "Rejects its input",
            .handler = tools::SyncHandler{[](const json&) -> Result<tools::ToolOutput> {
                return std::unexpected(make_error(ErrorCode::InvalidArgument, "Message cannot be empty"));
            }},
        }).has_value());

        REQUIRE(registry.register_tool(tools::ToolDescriptor{
            .name = "wait",
            .description = "Waits for the test to release it",
            .handler = tools::AsyncHandler{[gate](const json&, tasks::TaskContext&) -> Result<json> {
                gate.wait();
                return json{{"waited", true}};
            }},
        }).has_value());

        registry.seal();
    }

    ~ServerFixture() {
        open_gate();
    }

    void open_gate() {
        if (!released) {
            release->set_value();
            released = true;
        }
    }

    bool released = false;
};

auto request(McpServer& server, const json& id, const std::string& method,
             json params = json::object()) -> json {
    json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    auto line = server.handle_line(message.dump());
    REQUIRE(line.has_value());
    return json::parse(*line);
}

} // anonymous namespace

TEST_CASE("McpServer initialize handshake", "[protocol][server]") {
    ServerFixture f;
    dispatch::Dispatcher dispatcher(f.registry, f.task_manager);
    McpServer server(ServerConfig{}, f.registry, dispatcher, f.task_manager);

    SECTION("supported version") {
        auto response = request(server, 1, "initialize", {
            {"protocolVersion", "2024-11-05"},
            {"clientInfo", {{"name", "inspector"}, {"version", "1.0"}}},
        });
        CHECK(response["id"] == 1);
        CHECK(response["result"]["protocolVersion"] == "2024-11-05");
        CHECK(response["result"]["serverInfo"]["name"] == "mcptools");
        CHECK(response["result"]["capabilities"]["tools"]["listChanged"] == false);
        CHECK(server.initialized());
        REQUIRE(server.client_info().has_value());
        CHECK(server.client_info()->name == "inspector");
    }

    SECTION("unsupported version") {
        auto response = request(server, 1, "initialize", {{"protocolVersion", "1999-01-01"}});
        CHECK(response["error"]["code"] == rpc::InvalidParams);
        CHECK_FALSE(server.initialized());
    }

    SECTION("initialized notification gets no response") {
        auto line = server.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
        CHECK_FALSE(line.has_value());
    }
}

TEST_CASE("McpServer tools/list", "[protocol][server]") {
    ServerFixture f;
    dispatch::Dispatcher dispatcher(f.registry, f.task_manager);
    McpServer server(ServerConfig{}, f.registry, dispatcher, f.task_manager);

    auto response = request(server, 2, "tools/list");
    auto tools = response["result"]["tools"];
    REQUIRE(tools.size() == 4);
    CHECK(tools[0]["name"] == "sum");
    CHECK(tools[0]["inputSchema"]["required"].size() == 2);
    CHECK(tools[3]["name"] == "wait");
}

TEST_CASE("McpServer tools/call", "[protocol][server]") {
    ServerFixture f;
    dispatch::Dispatcher dispatcher(f.registry, f.task_manager);
    McpServer server(ServerConfig{}, f.registry, dispatcher, f.task_manager);

    SECTION("sync tool result") {
        auto response = request(server, 3, "tools/call", {
            {"name", "sum"}, {"arguments", {{"a", 2}, {"b", 3}}},
        });
        CHECK(response["result"]["isError"] == false);
        CHECK(response["result"]["content"][0]["type"] == "text");
        CHECK(response["result"]["content"][0]["text"] == "5");
    }

    SECTION("missing field is an invalid params error") {
        auto response = request(server, 4, "tools/call", {
            {"name", "sum"}, {"arguments", {{"a", 2}}},
        });
        CHECK(response["error"]["code"] == rpc::InvalidParams);
        CHECK(response["error"]["data"]["code"] == "MISSING_FIELD");
        CHECK(response["error"]["data"]["field"] == "b");
    }

    SECTION("unknown tool") {
        auto response = request(server, 5, "tools/call", {{"name", "nope"}});
        CHECK(response["error"]["code"] == rpc::InvalidParams);
        CHECK(response["error"]["data"]["code"] == "UNKNOWN_TOOL");
        CHECK(response["error"]["data"]["tool"] == "nope");
    }

    SECTION("missing name") {
        auto response = request(server, 6, "tools/call", {{"arguments", json::object()}});
        CHECK(response["error"]["code"] == rpc::InvalidParams);
    }

    SECTION("handler fault becomes an error result") {
        auto response = request(server, 7, "tools/call", {{"name", "fail"}});
        CHECK_FALSE(response.contains("error"));
        CHECK(response["result"]["isError"] == true);
        CHECK(response["result"]["content"][0]["text"] == "disk on fire");
    }

    SECTION("tool-reported invalid argument is a result, not invalid params") {
        auto response = request(server, 8, "tools/call", {{"name", "reject"}});
        CHECK_FALSE(response.contains("error"));
        CHECK(response["result"]["isError"] == true);
        CHECK(response["result"]["content"][0]["text"] == "Message cannot be empty");
    }

    SECTION("async tool returns a task id immediately") {
        auto response = request(server, 8, "tools/call", {{"name", "wait"}});
        auto task_id = response["result"]["_meta"]["taskId"].get<std::string>();
        CHECK(response["result"]["content"][0]["text"] == "Task started with id: " + task_id);

        auto status = request(server, 9, "tasks/get", {{"taskId", task_id}});
        auto state = status["result"]["status"].get<std::string>();
        CHECK((state == "pending" || state == "running"));

        f.open_gate();
        auto done = f.task_manager.wait_for_terminal(task_id, 5s);
        REQUIRE(done.has_value());

        status = request(server, 10, "tasks/get", {{"taskId", task_id}});
        CHECK(status["result"]["status"] == "completed");
        CHECK(status["result"]["result"]["waited"] == true);
    }
}

TEST_CASE("McpServer task methods", "[protocol][server]") {
    ServerFixture f;
    dispatch::Dispatcher dispatcher(f.registry, f.task_manager);
    McpServer server(ServerConfig{}, f.registry, dispatcher, f.task_manager);

    auto started = request(server, 1, "tools/call", {{"name", "wait"}});
    auto task_id = started["result"]["_meta"]["taskId"].get<std::string>();

    SECTION("reap of a running task is refused") {
        auto response = request(server, 2, "tasks/reap", {{"taskId", task_id}});
        CHECK(response["error"]["code"] == rpc::InvalidParams);
        CHECK(response["error"]["data"]["code"] == "TASK_STILL_RUNNING");
    }

    SECTION("cancel then reap") {
        auto cancelled = request(server, 3, "tasks/cancel", {{"taskId", task_id}});
        CHECK(cancelled["result"]["cancelRequested"] == true);

        f.open_gate();
        REQUIRE(f.task_manager.wait_for_terminal(task_id, 5s).has_value());

        auto reaped = request(server, 4, "tasks/reap", {{"taskId", task_id}});
        CHECK(reaped["result"]["reaped"] == true);

        auto gone = request(server, 5, "tasks/get", {{"taskId", task_id}});
        CHECK(gone["error"]["data"]["code"] == "TASK_NOT_FOUND");
    }

    SECTION("cancel of a finished task is not recorded") {
        f.open_gate();
        REQUIRE(f.task_manager.wait_for_terminal(task_id, 5s).has_value());

        auto cancelled = request(server, 10, "tasks/cancel", {{"taskId", task_id}});
        CHECK(cancelled["result"]["cancelRequested"] == false);
        CHECK(cancelled["result"]["status"] == "completed");

        auto snapshot = request(server, 11, "tasks/get", {{"taskId", task_id}});
        CHECK(snapshot["result"]["cancelRequested"] == false);
    }

    SECTION("list with filter") {
        auto all = request(server, 6, "tasks/list");
        REQUIRE(all["result"]["tasks"].size() == 1);
        CHECK(all["result"]["tasks"][0]["taskId"] == task_id);

        auto completed = request(server, 7, "tasks/list", {{"status", "completed"}});
        CHECK(completed["result"]["tasks"].empty());

        auto bad = request(server, 8, "tasks/list", {{"status", "bogus"}});
        CHECK(bad["error"]["code"] == rpc::InvalidParams);
    }

    SECTION("unknown task") {
        auto response = request(server, 9, "tasks/cancel", {{"taskId", "task-unknown"}});
        CHECK(response["error"]["data"]["code"] == "TASK_NOT_FOUND");
        CHECK(response["error"]["data"]["taskId"] == "task-unknown");
    }
}

TEST_CASE("McpServer malformed input", "[protocol][server]") {
    ServerFixture f;
    dispatch::Dispatcher dispatcher(f.registry, f.task_manager);
    McpServer server(ServerConfig{}, f.registry, dispatcher, f.task_manager);

    SECTION("parse error") {
        auto line = server.handle_line("{not json");
        REQUIRE(line.has_value());
        auto response = json::parse(*line);
        CHECK(response["error"]["code"] == rpc::ParseError);
        CHECK(response["id"].is_null());
    }

    SECTION("invalid request keeps the id") {
        auto line = server.handle_line(R"({"jsonrpc":"1.0","id":42,"method":"ping"})");
        REQUIRE(line.has_value());
        auto response = json::parse(*line);
        CHECK(response["error"]["code"] == rpc::InvalidRequest);
        CHECK(response["id"] == 42);
    }

    SECTION("unknown method") {
        auto response = request(server, 1, "resources/list");
        CHECK(response["error"]["code"] == rpc::MethodNotFound);
    }

    SECTION("blank lines are skipped") {
        CHECK_FALSE(server.handle_line("   ").has_value());
        CHECK_FALSE(server.handle_line("").has_value());
    }

    SECTION("unknown notifications are ignored") {
        CHECK_FALSE(server.handle_line(R"({"jsonrpc":"2.0","method":"notifications/whatever"})").has_value());
    }

    SECTION("ping") {
        auto response = request(server, "p1", "ping");
        CHECK(response["id"] == "p1");
        CHECK(response["result"].empty());
    }
}

TEST_CASE("McpServer method table", "[protocol][server]") {
    ServerFixture f;
    dispatch::Dispatcher dispatcher(f.registry, f.task_manager);
    McpServer server(ServerConfig{}, f.registry, dispatcher, f.task_manager);

    CHECK(server.has_method("tools/call"));
    CHECK(server.has_method("tasks/reap"));
    CHECK_FALSE(server.has_method("resources/list"));

    server.register_method("echo", [](const json& params) -> Result<json> { return params; });
    auto response = request(server, 1, "echo", {{"x", 1}});
    CHECK(response["result"]["x"] == 1);

    auto methods = server.methods();
    REQUIRE_FALSE(methods.empty());
    for (std::size_t i = 1; i < methods.size(); ++i) {
        CHECK(methods[i - 1].name < methods[i].name);
    }
}

TEST_CASE("render_content", "[protocol][server]") {
    CHECK(render_content(json("plain text")) == "plain text");
    CHECK(render_content(json(5)) == "5");
    CHECK(render_content(json{{"a", 1}}) == "{\n  \"a\": 1\n}");
}
