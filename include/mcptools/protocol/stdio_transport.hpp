#pragma once

#include <cstddef>
#include <ostream>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "mcptools/protocol/server.hpp"

namespace mcptools::protocol {

/// Newline-delimited JSON-RPC over a pair of file descriptors (stdin and
/// stdout by default). Responses go to `out` one line each; logging stays
/// on stderr so the channel carries nothing else.
class StdioTransport {
public:
    StdioTransport(boost::asio::io_context& ioc, McpServer& server,
                   int input_fd, std::ostream& out);

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Serve lines until EOF or stop(). Blank lines are skipped.
    auto run() -> boost::asio::awaitable<void>;

    /// Abort a pending read; run() returns.
    void stop();

    [[nodiscard]] auto messages_handled() const noexcept -> std::size_t {
        return messages_handled_;
    }

private:
    McpServer& server_;
    boost::asio::posix::stream_descriptor input_;
    std::ostream& out_;
    std::size_t messages_handled_ = 0;
};

} // namespace mcptools::protocol
