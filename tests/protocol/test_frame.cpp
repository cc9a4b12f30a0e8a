#include <catch2/catch_test_macros.hpp>

#include "mcptools/protocol/frame.hpp"

using namespace mcptools;
using namespace mcptools::protocol;

TEST_CASE("parse_request accepts JSON-RPC 2.0 requests", "[protocol][frame]") {
    SECTION("request with integer id and params") {
        auto frame = parse_request(json::parse(
            R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"bash"}})"));
        REQUIRE(frame.has_value());
        CHECK(frame->method == "tools/call");
        REQUIRE(frame->id.has_value());
        CHECK(*frame->id == 7);
        CHECK(frame->params["name"] == "bash");
        CHECK_FALSE(frame->is_notification());
    }

    SECTION("string id") {
        auto frame = parse_request(json::parse(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})"));
        REQUIRE(frame.has_value());
        CHECK(*frame->id == "abc");
        CHECK(frame->params.is_object());
        CHECK(frame->params.empty());
    }

    SECTION("notification has no id") {
        auto frame = parse_request(json::parse(
            R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
        REQUIRE(frame.has_value());
        CHECK(frame->is_notification());
    }
}

TEST_CASE("parse_request rejects malformed requests", "[protocol][frame]") {
    auto rejects = [](const char* text) {
        auto frame = parse_request(json::parse(text));
        REQUIRE_FALSE(frame.has_value());
        CHECK(frame.error().code() == ErrorCode::ProtocolError);
    };

    SECTION("not an object") { rejects("[1,2,3]"); }
    SECTION("wrong version") { rejects(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"); }
    SECTION("missing version") { rejects(R"({"id":1,"method":"ping"})"); }
    SECTION("missing method") { rejects(R"({"jsonrpc":"2.0","id":1})"); }
    SECTION("non-string method") { rejects(R"({"jsonrpc":"2.0","id":1,"method":5})"); }
    SECTION("object id") { rejects(R"({"jsonrpc":"2.0","id":{},"method":"ping"})"); }
    SECTION("scalar params") { rejects(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":3})"); }
}

TEST_CASE("parse_json reports malformed input", "[protocol][frame]") {
    CHECK(parse_json(R"({"a":1})").has_value());

    auto bad = parse_json("{not json");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::SerializationError);
}

TEST_CASE("Response serialization", "[protocol][frame]") {
    SECTION("success") {
        auto line = serialize_response(make_response(1, json{{"ok", true}}));
        auto j = json::parse(line);
        CHECK(j["jsonrpc"] == "2.0");
        CHECK(j["id"] == 1);
        CHECK(j["result"]["ok"] == true);
        CHECK_FALSE(j.contains("error"));
        CHECK(line.find('\n') == std::string::npos);
    }

    SECTION("error") {
        auto line = serialize_response(
            make_error_response("x", rpc::MethodNotFound, "Method not found: nope"));
        auto j = json::parse(line);
        CHECK(j["id"] == "x");
        CHECK(j["error"]["code"] == -32601);
        CHECK(j["error"]["message"] == "Method not found: nope");
        CHECK_FALSE(j["error"].contains("data"));
        CHECK_FALSE(j.contains("result"));
    }

    SECTION("newlines inside values stay escaped") {
        auto line = serialize_response(make_response(2, json{{"text", "a\nb"}}));
        CHECK(line.find('\n') == std::string::npos);
    }
}

TEST_CASE("to_rpc_error maps internal errors", "[protocol][frame]") {
    SECTION("missing field") {
        auto e = to_rpc_error(make_error(ErrorCode::MissingField, "missing required field", "b"));
        CHECK(e.code == rpc::InvalidParams);
        CHECK(e.message == "missing required field: b");
        REQUIRE(e.data.has_value());
        CHECK((*e.data)["code"] == "MISSING_FIELD");
        CHECK((*e.data)["field"] == "b");
    }

    SECTION("unknown tool") {
        auto e = to_rpc_error(make_error(ErrorCode::UnknownTool, "Unknown tool", "nope"));
        CHECK(e.code == rpc::InvalidParams);
        CHECK((*e.data)["tool"] == "nope");
    }

    SECTION("task errors") {
        auto e = to_rpc_error(make_error(ErrorCode::TaskStillRunning, "Task has not finished", "task-1"));
        CHECK(e.code == rpc::InvalidParams);
        CHECK(e.message == "Task has not finished");
        CHECK((*e.data)["code"] == "TASK_STILL_RUNNING");
        CHECK((*e.data)["taskId"] == "task-1");
    }

    SECTION("everything else is internal") {
        auto e = to_rpc_error(make_error(ErrorCode::IoError, "disk", "sda"));
        CHECK(e.code == rpc::InternalError);
        CHECK((*e.data)["detail"] == "sda");
    }
}
