#include <catch2/catch_test_macros.hpp>

#include "mcptools/infra/html_text.hpp"

using namespace mcptools::infra;

TEST_CASE("extract_hostname", "[infra][html]") {
    CHECK(extract_hostname("https://www.example.com/path?q=1") == "www.example.com");
    CHECK(extract_hostname("http://user:pw@host.io:8080/x") == "host.io");
    CHECK(extract_hostname("https://example.org") == "example.org");
    CHECK(extract_hostname("https://example.org#frag") == "example.org");
    CHECK(extract_hostname("not a url") == "");
}

TEST_CASE("html_to_text", "[infra][html]") {
    SECTION("block elements become separate lines") {
        CHECK(html_to_text("<p>Hello</p><p>World</p>") == "Hello\n\nWorld");
    }

    SECTION("invisible content is dropped") {
        auto text = html_to_text(
            "<html><head><title>T</title><style>p{}</style></head>"
            "<body><script>alert(1)</script><!-- note -->"
            "<div style=\"display:none\">secret</div>"
            "<span aria-hidden=\"true\">icon</span>"
            "<p>shown</p></body></html>");
        CHECK(text == "shown");
    }

    SECTION("lists and entities") {
        auto text = html_to_text("<h1>Title</h1><ul><li>One &amp; two</li><li>&lt;three&gt;</li></ul>");
        CHECK(text == "Title\n\n- One & two\n\n- <three>");
    }

    SECTION("whitespace inside lines collapses") {
        CHECK(html_to_text("<p>  lots   of\t space  </p>") == "lots of space");
    }

    SECTION("source footer") {
        auto text = html_to_text("<p>Hi</p>", "https://docs.example.com/page");
        CHECK(text == "Hi\n\nSource: https://docs.example.com/page\nDomain: docs.example.com");
    }

    SECTION("empty page with source") {
        CHECK(html_to_text("", "https://a.io") == "Source: https://a.io\nDomain: a.io");
    }
}
