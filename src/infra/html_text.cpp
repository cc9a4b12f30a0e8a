#include "mcptools/infra/html_text.hpp"

#include <regex>
#include <sstream>
#include <utility>
#include <vector>

#include "mcptools/core/utils.hpp"

namespace mcptools::infra {

namespace {

auto drop_invisible(std::string html) -> std::string {
    static const std::regex invisible[] = {
        std::regex(R"(<!--[\s\S]*?-->)"),
        std::regex(R"(<script\b[^>]*>[\s\S]*?</script\s*>)", std::regex::icase),
        std::regex(R"(<style\b[^>]*>[\s\S]*?</style\s*>)", std::regex::icase),
        std::regex(R"(<noscript\b[^>]*>[\s\S]*?</noscript\s*>)", std::regex::icase),
        std::regex(R"(<head\b[^>]*>[\s\S]*?</head\s*>)", std::regex::icase),
        std::regex(R"(<[^>]*\bstyle\s*=\s*"[^"]*display\s*:\s*none[^"]*"[^>]*>[\s\S]*?</[^>]+>)", std::regex::icase),
        std::regex(R"(<[^>]*\baria-hidden\s*=\s*"true"[^>]*>[\s\S]*?</[^>]+>)", std::regex::icase),
    };

    for (const auto& pattern : invisible) {
        html = std::regex_replace(html, pattern, "");
    }
    return html;
}

auto decode_entities(std::string_view text) -> std::string {
    static const std::vector<std::pair<std::string_view, std::string_view>> named = {
        {"&nbsp;", " "}, {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"},
        {"&quot;", "\""}, {"&#39;", "'"}, {"&apos;", "'"},
        {"&mdash;", "-"}, {"&ndash;", "-"}, {"&hellip;", "..."},
    };

    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }

        bool replaced = false;
        for (const auto& [entity, value] : named) {
            if (text.substr(i, entity.size()) == entity) {
                out += value;
                i += entity.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            out += text[i++];
        }
    }
    return out;
}

auto collapse_lines(std::string_view text) -> std::string {
    std::istringstream in{std::string(text)};
    std::string line;
    std::string out;
    bool previous_blank = true;

    static const std::regex spaces(R"([ \t\r\f\v]+)");

    while (std::getline(in, line)) {
        auto cleaned = utils::trim(std::regex_replace(line, spaces, " "));
        if (cleaned.empty()) {
            if (!previous_blank) out += '\n';
            previous_blank = true;
            continue;
        }
        out += cleaned;
        out += '\n';
        previous_blank = false;
    }

    while (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

} // anonymous namespace

auto extract_hostname(std::string_view url) -> std::string {
    auto pos = url.find("://");
    if (pos == std::string_view::npos) {
        return {};
    }
    url = url.substr(pos + 3);

    pos = url.find_first_of("/?#");
    if (pos != std::string_view::npos) {
        url = url.substr(0, pos);
    }

    pos = url.rfind('@');
    if (pos != std::string_view::npos) {
        url = url.substr(pos + 1);
    }

    pos = url.find(':');
    if (pos != std::string_view::npos) {
        url = url.substr(0, pos);
    }

    return std::string(url);
}

auto html_to_text(std::string_view html, std::optional<std::string_view> source_url)
    -> std::string
{
    static const std::regex line_breaks(
        R"(<br\s*/?>|</?(p|div|section|article|header|footer|li|ul|ol|tr|table|h[1-6]|pre|blockquote)\b[^>]*>)",
        std::regex::icase);
    static const std::regex list_items(R"(<li\b[^>]*>)", std::regex::icase);
    static const std::regex tags(R"(<[^>]*>)");

    auto text = drop_invisible(std::string(html));
    text = std::regex_replace(text, list_items, "\n- ");
    text = std::regex_replace(text, line_breaks, "\n");
    text = std::regex_replace(text, tags, "");
    text = collapse_lines(decode_entities(text));

    if (source_url) {
        if (!text.empty()) text += "\n\n";
        text += "Source: ";
        text += *source_url;

        auto host = extract_hostname(*source_url);
        if (!host.empty()) {
            text += "\nDomain: ";
            text += host;
        }
    }

    return text;
}

} // namespace mcptools::infra
