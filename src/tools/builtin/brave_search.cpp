#include "mcptools/tools/builtin.hpp"

#include <algorithm>
#include <memory>

#include "mcptools/core/logger.hpp"
#include "mcptools/core/utils.hpp"
#include "mcptools/infra/http_client.hpp"

namespace mcptools::tools {

namespace {

constexpr int kDefaultCount = 10;
constexpr int kMaxCount = 20;

} // anonymous namespace

auto format_search_results(const json& response, int count) -> std::string {
    auto web = response.find("web");
    if (web == response.end() || !web->is_object() ||
        !web->contains("results") || !(*web)["results"].is_array()) {
        return "No web results found";
    }

    std::string text;
    int emitted = 0;
    for (const auto& result : (*web)["results"]) {
        if (emitted >= count) break;
        if (emitted > 0) text += "---\n";

        text += "Title: " + result.value("title", "") + "\n";
        text += "URL: " + result.value("url", "") + "\n";

        auto description = result.value("description", "");
        text += "Description: " +
                (description.empty() ? std::string("No description available") : description) + "\n";

        if (auto age = result.value("page_age", ""); !age.empty()) {
            text += "Age: " + age + "\n";
        }
        text += "\n";
        ++emitted;
    }

    return emitted == 0 ? "No web results found" : text;
}

auto make_brave_search_tool(const SearchToolConfig& config) -> ToolDescriptor {
    auto client = std::make_shared<infra::HttpClient>(infra::HttpClientConfig{
        .base_url = config.base_url,
        .timeout_seconds = config.timeout_seconds,
        .default_headers = {
            {"Accept", "application/json"},
            {"X-Subscription-Token", config.api_key},
        },
    });

    return ToolDescriptor{
        .name = "brave_search",
        .description =
            "Search the web with the Brave Search API. Returns title, URL and "
            "description for each result. Be specific and include relevant "
            "keywords in the query.",
        .parameters = {.fields = {
            {.name = "query", .kind = schema::FieldKind::String,
             .description = "The search query"},
            {.name = "count", .kind = schema::FieldKind::Integer,
             .description = "Number of results to return (max 20)",
             .required = false, .default_value = kDefaultCount},
        }},
        .handler = SyncHandler{
            [client](const json& args) -> Result<ToolOutput> {
                auto query = args.at("query").get<std::string>();
                int count = std::clamp(args.value("count", kDefaultCount), 1, kMaxCount);

                LOG_INFO("brave_search: '{}' (count {})", query, count);

                auto path = "/res/v1/web/search?q=" + utils::url_encode(query) +
                            "&count=" + std::to_string(count) + "&safesearch=moderate";
                auto response = client->get(path);
                if (!response) {
                    return std::unexpected(response.error());
                }
                if (!response->is_success()) {
                    return std::unexpected(make_error(
                        ErrorCode::ProviderError,
                        "Search request failed with status " + std::to_string(response->status),
                        utils::tail(response->body, 512)));
                }

                json body;
                try {
                    body = json::parse(response->body);
                } catch (const json::parse_error& e) {
                    return std::unexpected(make_error(
                        ErrorCode::SerializationError,
                        "Failed to parse search response", e.what()));
                }

                return ToolOutput{.content = format_search_results(body, count)};
            }},
    };
}

} // namespace mcptools::tools
