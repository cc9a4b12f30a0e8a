#include "mcptools/tools/builtin.hpp"

#include <memory>

#include "mcptools/core/logger.hpp"
#include "mcptools/core/utils.hpp"
#include "mcptools/infra/html_text.hpp"
#include "mcptools/infra/http_client.hpp"

namespace mcptools::tools {

auto make_scrape_url_tool(const ScrapeToolConfig& config) -> ToolDescriptor {
    auto client = std::make_shared<infra::HttpClient>(infra::HttpClientConfig{
        .base_url = config.base_url,
        .timeout_seconds = config.timeout_seconds,
    });

    return ToolDescriptor{
        .name = "scrape_url",
        .description =
            "Fetch a web page (JavaScript rendered) and return its readable "
            "text, followed by the source URL and domain.",
        .parameters = {.fields = {
            {.name = "url", .kind = schema::FieldKind::String,
             .description = "Absolute http(s) URL to fetch"},
        }},
        .handler = SyncHandler{
            [client, api_key = config.api_key, render_js = config.render_js]
            (const json& args) -> Result<ToolOutput> {
                auto url = args.at("url").get<std::string>();
                if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
                    return std::unexpected(make_error(
                        ErrorCode::InvalidArgument,
                        "URL must start with http:// or https://", url));
                }

                LOG_INFO("scrape_url: {}", url);

                auto path = "/api/v1/?api_key=" + utils::url_encode(api_key) +
                            "&url=" + utils::url_encode(url) +
                            "&render_js=" + (render_js ? "true" : "false");
                auto response = client->get(path);
                if (!response) {
                    return std::unexpected(response.error());
                }
                if (!response->is_success()) {
                    return std::unexpected(make_error(
                        ErrorCode::ProviderError,
                        "Scrape request failed with status " + std::to_string(response->status),
                        utils::tail(response->body, 512)));
                }

                return ToolOutput{.content = infra::html_to_text(response->body, url)};
            }},
    };
}

} // namespace mcptools::tools
