#include "mcptools/infra/http_client.hpp"
#include "mcptools/core/logger.hpp"

#include <httplib.h>

#include <mutex>
#include <utility>

namespace mcptools::infra {

namespace {

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        std::string detail;
        switch (err) {
            case httplib::Error::Connection:
                detail = "Connection failed";
                break;
            case httplib::Error::Read:
                detail = "Read error";
                break;
            case httplib::Error::Write:
                detail = "Write error";
                break;
            case httplib::Error::ExceedRedirectCount:
                detail = "Exceeded redirect count";
                break;
            case httplib::Error::Canceled:
                detail = "Request canceled";
                break;
            case httplib::Error::SSLConnection:
                detail = "SSL connection error";
                break;
            case httplib::Error::SSLServerVerification:
                detail = "SSL server verification failed";
                break;
            case httplib::Error::ConnectionTimeout:
                return std::unexpected(
                    make_error(ErrorCode::Timeout,
                               "HTTP request timed out",
                               "Connection timeout"));
            default:
                detail = httplib::to_string(err);
                break;
        }
        return std::unexpected(
            make_error(ErrorCode::ConnectionFailed,
                       "HTTP request failed", detail));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

} // anonymous namespace

struct HttpClient::Impl {
    HttpClientConfig config;
    std::unique_ptr<httplib::Client> client;
    // httplib::Client is not thread-safe; tasks may share one instance.
    std::mutex mutex;

    explicit Impl(HttpClientConfig config_)
        : config(std::move(config_)) {
        client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);
        client->set_follow_location(true);

        if (!config.verify_ssl) {
            client->enable_server_certificate_verification(false);
        }

        apply_default_headers();
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    void apply_default_headers() {
        httplib::Headers hdrs;
        for (const auto& [key, value] : config.default_headers) {
            hdrs.emplace(key, value);
        }
        client->set_default_headers(hdrs);
    }

    static auto to_headers(const std::map<std::string, std::string>& extra)
        -> httplib::Headers {
        httplib::Headers hdrs;
        for (const auto& [k, v] : extra) {
            hdrs.emplace(k, v);
        }
        return hdrs;
    }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::get(std::string_view path,
                     const std::map<std::string, std::string>& headers)
    -> Result<HttpResponse> {
    std::lock_guard lock(impl_->mutex);
    LOG_DEBUG("GET {}{}", impl_->config.base_url, path);
    auto res = impl_->client->Get(std::string(path), Impl::to_headers(headers));
    return to_http_response(res);
}

void HttpClient::set_default_header(std::string key, std::string value) {
    std::lock_guard lock(impl_->mutex);
    impl_->config.default_headers[std::move(key)] = std::move(value);
    impl_->apply_default_headers();
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace mcptools::infra
