#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "mcptools/core/error.hpp"

namespace mcptools::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Blocking HTTP client wrapping cpp-httplib. Tool handlers call it from
/// the request thread or a task worker, never from the protocol loop.
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Performs an HTTP GET. `path` may carry a query string.
    auto get(std::string_view path,
             const std::map<std::string, std::string>& headers = {})
        -> Result<HttpResponse>;

    /// Sets a default header that will be sent with every request.
    void set_default_header(std::string key, std::string value);

    /// Returns the base URL.
    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcptools::infra
