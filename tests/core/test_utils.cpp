#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "mcptools/core/utils.hpp"

TEST_CASE("generate_uuid produces valid format", "[utils]") {
    auto uuid = mcptools::utils::generate_uuid();

    REQUIRE(uuid.size() == 36);
    CHECK(uuid[8] == '-');
    CHECK(uuid[13] == '-');
    CHECK(uuid[18] == '-');
    CHECK(uuid[23] == '-');

    SECTION("successive calls differ") {
        CHECK(mcptools::utils::generate_uuid() != mcptools::utils::generate_uuid());
    }
}

TEST_CASE("timestamp_iso formats UTC with milliseconds", "[utils]") {
    auto tp = mcptools::Timestamp(std::chrono::milliseconds(1'700'000'000'123));
    CHECK(mcptools::utils::timestamp_iso(tp) == "2023-11-14T22:13:20.123Z");
}

TEST_CASE("trim removes surrounding whitespace", "[utils]") {
    using mcptools::utils::trim;

    CHECK(trim("  hello  ") == "hello");
    CHECK(trim("\t\nline\r\n") == "line");
    CHECK(trim("   ") == "");
    CHECK(trim("") == "");
    CHECK(trim("a b") == "a b");
}

TEST_CASE("url_encode escapes reserved characters", "[utils]") {
    using mcptools::utils::url_encode;

    CHECK(url_encode("hello world") == "hello%20world");
    CHECK(url_encode("a&b=c") == "a%26b%3Dc");
    CHECK(url_encode("safe-_.~") == "safe-_.~");
    CHECK(url_encode("https://x.io/?q=1") == "https%3A%2F%2Fx.io%2F%3Fq%3D1");
}

TEST_CASE("tail keeps the end of long strings", "[utils]") {
    using mcptools::utils::tail;

    CHECK(tail("short", 10) == "short");
    CHECK(tail("abcdef", 3) == "...def");
    CHECK(tail("", 0) == "");
}
