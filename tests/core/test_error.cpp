#include <catch2/catch_test_macros.hpp>

#include "mcptools/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        mcptools::Error err(mcptools::ErrorCode::UnknownTool, "unknown tool");
        CHECK(err.code() == mcptools::ErrorCode::UnknownTool);
        CHECK(err.message() == "unknown tool");
        CHECK(err.detail() == "");
        CHECK(err.what() == "unknown tool");
    }

    SECTION("error with detail") {
        mcptools::Error err(mcptools::ErrorCode::MissingField,
                            "missing required field", "x");
        CHECK(err.code() == mcptools::ErrorCode::MissingField);
        CHECK(err.message() == "missing required field");
        CHECK(err.detail() == "x");
        CHECK(err.what() == "missing required field: x");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = mcptools::make_error(mcptools::ErrorCode::HandlerFault, "tool failed");
        CHECK(err.code() == mcptools::ErrorCode::HandlerFault);
        CHECK(err.message() == "tool failed");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = mcptools::make_error(mcptools::ErrorCode::Timeout,
                                        "request timed out", "after 30s");
        CHECK(err.code() == mcptools::ErrorCode::Timeout);
        CHECK(err.what() == "request timed out: after 30s");
    }
}

TEST_CASE("Result type success case", "[error]") {
    mcptools::Result<int> result = 42;

    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("Result type error case", "[error]") {
    mcptools::Result<int> result = std::unexpected(
        mcptools::make_error(mcptools::ErrorCode::TypeMismatch, "expected string, got integer"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == mcptools::ErrorCode::TypeMismatch);
    CHECK(result.error().message() == "expected string, got integer");
}

TEST_CASE("VoidResult success and error", "[error]") {
    SECTION("success") {
        mcptools::VoidResult result{};
        REQUIRE(result.has_value());
    }

    SECTION("error") {
        mcptools::VoidResult result = std::unexpected(
            mcptools::make_error(mcptools::ErrorCode::TaskStillRunning, "still running"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == mcptools::ErrorCode::TaskStillRunning);
    }
}

TEST_CASE("error_code_to_string", "[error]") {
    using mcptools::ErrorCode;
    using mcptools::error_code_to_string;

    CHECK(error_code_to_string(ErrorCode::UnknownTool) == "UNKNOWN_TOOL");
    CHECK(error_code_to_string(ErrorCode::MissingField) == "MISSING_FIELD");
    CHECK(error_code_to_string(ErrorCode::TypeMismatch) == "TYPE_MISMATCH");
    CHECK(error_code_to_string(ErrorCode::HandlerFault) == "HANDLER_FAULT");
    CHECK(error_code_to_string(ErrorCode::TaskNotFound) == "TASK_NOT_FOUND");
    CHECK(error_code_to_string(ErrorCode::TaskStillRunning) == "TASK_STILL_RUNNING");
    CHECK(error_code_to_string(ErrorCode::Cancelled) == "CANCELLED");
}
