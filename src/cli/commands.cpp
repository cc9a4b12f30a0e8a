#include "mcptools/cli/commands.hpp"
#include "mcptools/core/logger.hpp"

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "mcptools/dispatch/dispatcher.hpp"
#include "mcptools/protocol/server.hpp"
#include "mcptools/protocol/stdio_transport.hpp"
#include "mcptools/tasks/manager.hpp"
#include "mcptools/tools/builtin.hpp"
#include "mcptools/tools/registry.hpp"

#ifndef MCPTOOLS_VERSION_STRING
#define MCPTOOLS_VERSION_STRING "0.1.0-dev"
#endif

namespace mcptools::cli {

auto redact_config_json(json& j) -> void {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "token", "secret",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

void register_serve_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("serve", "Serve tools over stdio (JSON-RPC, one message per line)");

    sub->callback([&config]() {
        auto grace = std::chrono::milliseconds(config.tasks.shutdown_grace_ms);

        LOG_INFO("Starting {} {} ({} task workers)",
                 config.server.name, config.server.version, config.tasks.worker_threads);

        tasks::TaskManager task_manager(config.tasks.worker_threads, grace);

        tools::ToolRegistry registry;
        if (auto registered = tools::register_builtin_tools(registry, task_manager, config);
            !registered) {
            LOG_ERROR("Failed to register tools: {}", registered.error().what());
            throw CLI::RuntimeError(1);
        }
        registry.seal();

        dispatch::Dispatcher dispatcher(registry, task_manager);
        protocol::McpServer server(config.server, registry, dispatcher, task_manager);

        boost::asio::io_context ioc;
        protocol::StdioTransport transport(ioc, server, STDIN_FILENO, std::cout);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&transport](const boost::system::error_code& ec, int sig) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down", sig);
                transport.stop();
            }
        });

        boost::asio::co_spawn(ioc, transport.run(),
            [&signals](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Transport failed: {}", e.what());
                    }
                }
                signals.cancel();
            });

        ioc.run();

        LOG_INFO("Transport closed after {} messages", transport.messages_handled());
        task_manager.shutdown(grace);
    });
}

void register_tools_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("tools", "Print the tool catalog as JSON");

    sub->callback([&config]() {
        tasks::TaskManager task_manager(1, std::chrono::milliseconds(0));
        tools::ToolRegistry registry;
        if (auto registered = tools::register_builtin_tools(registry, task_manager, config);
            !registered) {
            LOG_ERROR("Failed to register tools: {}", registered.error().what());
            throw CLI::RuntimeError(1);
        }
        std::cout << json{{"tools", registry.to_json()}}.dump(2) << "\n";
    });
}

void register_config_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&config, validate_only]() {
        if (*validate_only) {
            // If we got here the config parsed successfully.
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = config;
        redact_config_json(j);
        std::cout << j.dump(2) << "\n";
    });
}

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "mcptools " << MCPTOOLS_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace mcptools::cli
