#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mcptools::infra {

/// Host part of a URL ("https://user@www.example.com:8080/x" ->
/// "www.example.com"). Empty if there is none.
auto extract_hostname(std::string_view url) -> std::string;

/// Turns an HTML page into readable plain text: script, style and hidden
/// elements are dropped, block elements become line breaks, entities are
/// decoded and runs of blank lines collapse to one.
///
/// With a source URL, a "Source: <url>" line and, when the URL has a host,
/// a "Domain: <host>" line are appended after a blank line.
auto html_to_text(std::string_view html,
                  std::optional<std::string_view> source_url = std::nullopt)
    -> std::string;

} // namespace mcptools::infra
