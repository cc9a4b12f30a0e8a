#include <catch2/catch_test_macros.hpp>

#include "mcptools/infra/http_client.hpp"

using namespace mcptools;
using namespace mcptools::infra;

TEST_CASE("HttpClient basics", "[infra][http]") {
    HttpClient client(HttpClientConfig{
        .base_url = "http://127.0.0.1:1",
        .timeout_seconds = 2,
    });

    CHECK(client.base_url() == "http://127.0.0.1:1");

    SECTION("refused connection maps to ConnectionFailed") {
        auto response = client.get("/anything", {{"Accept", "application/json"}});
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::ConnectionFailed);
    }
}

TEST_CASE("HttpResponse success range", "[infra][http]") {
    HttpResponse response;
    response.status = 200;
    CHECK(response.is_success());
    response.status = 299;
    CHECK(response.is_success());
    response.status = 301;
    CHECK_FALSE(response.is_success());
    response.status = 404;
    CHECK_FALSE(response.is_success());
}
