#include "mcptools/protocol/stdio_transport.hpp"

#include <istream>
#include <string>

#include <unistd.h>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mcptools/core/logger.hpp"

namespace mcptools::protocol {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace {

/// One message can be large (file contents in arguments), but not unbounded.
constexpr std::size_t kMaxLineBytes = 64 * 1024 * 1024;

} // anonymous namespace

StdioTransport::StdioTransport(boost::asio::io_context& ioc, McpServer& server,
                               int input_fd, std::ostream& out)
    : server_(server)
    // The descriptor owns what it wraps; dup so closing it leaves stdin alone.
    , input_(ioc, ::dup(input_fd))
    , out_(out)
{
}

auto StdioTransport::run() -> awaitable<void> {
    LOG_INFO("Serving MCP over stdio");

    boost::asio::streambuf buffer(kMaxLineBytes);

    while (true) {
        boost::system::error_code ec;
        auto n = co_await boost::asio::async_read_until(
            input_, buffer, '\n', boost::asio::redirect_error(use_awaitable, ec));

        if (ec && n == 0) {
            // EOF may leave a final unterminated line in the buffer.
            if (ec == boost::asio::error::eof && buffer.size() > 0) {
                n = buffer.size();
            } else {
                if (ec == boost::asio::error::eof) {
                    LOG_INFO("Input closed, ending session");
                } else if (ec == boost::asio::error::operation_aborted) {
                    LOG_INFO("Stdio transport stopped");
                } else if (ec == boost::asio::error::not_found) {
                    LOG_ERROR("Input line exceeds {} bytes, ending session", kMaxLineBytes);
                } else {
                    LOG_ERROR("Stdin read failed: {}", ec.message());
                }
                break;
            }
        }

        std::string line(boost::asio::buffers_begin(buffer.data()),
                         boost::asio::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(n));
        buffer.consume(n);

        if (auto response = server_.handle_line(line)) {
            out_ << *response << '\n';
            out_.flush();
        }
        ++messages_handled_;

        if (ec) {
            break;
        }
    }

    co_return;
}

void StdioTransport::stop() {
    boost::system::error_code ec;
    input_.cancel(ec);
    if (ec) {
        LOG_DEBUG("Cancelling stdin read: {}", ec.message());
    }
}

} // namespace mcptools::protocol
