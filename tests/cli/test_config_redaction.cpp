#include <catch2/catch_test_macros.hpp>

#include "mcptools/cli/commands.hpp"

using mcptools::json;
using mcptools::cli::redact_config_json;

TEST_CASE("Config value redaction", "[cli][redaction]") {
    SECTION("Redacts api_key") {
        json config = {{"tools", {{"search", {{"api_key", "brave-12345"}, {"base_url", "https://x"}}}}}};
        redact_config_json(config);
        CHECK(config["tools"]["search"]["api_key"] == "***REDACTED***");
        CHECK(config["tools"]["search"]["base_url"] == "https://x");
    }

    SECTION("Preserves non-sensitive keys") {
        json config = {{"log_level", "info"}, {"tasks", {{"worker_threads", 8}}}};
        json original = config;
        redact_config_json(config);
        CHECK(config == original);
    }

    SECTION("Handles arrays of objects") {
        json config = {{"entries", json::array({{{"token", "t-1"}}, {{"secret", "s-2"}}})}};
        redact_config_json(config);
        CHECK(config["entries"][0]["token"] == "***REDACTED***");
        CHECK(config["entries"][1]["secret"] == "***REDACTED***");
    }

    SECTION("Skips empty strings") {
        json config = {{"api_key", ""}};
        redact_config_json(config);
        CHECK(config["api_key"] == "");
    }

    SECTION("Full config has every key redacted") {
        mcptools::Config cfg;
        cfg.tools.search.api_key = "a";
        cfg.tools.scrape.api_key = "b";
        cfg.tools.aider.api_key = "c";
        json j = cfg;
        redact_config_json(j);
        CHECK(j["tools"]["search"]["api_key"] == "***REDACTED***");
        CHECK(j["tools"]["scrape"]["api_key"] == "***REDACTED***");
        CHECK(j["tools"]["aider"]["api_key"] == "***REDACTED***");
        CHECK(j["tools"]["aider"]["binary"] == "aider");
    }
}
