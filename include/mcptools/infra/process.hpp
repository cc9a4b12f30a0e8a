#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "mcptools/core/error.hpp"

namespace mcptools::infra {

enum class OutputStream {
    Stdout,
    Stderr,
};

struct ProcessOptions {
    /// argv[0] is looked up on PATH.
    std::vector<std::string> argv;
    /// Empty means the server's working directory.
    std::filesystem::path cwd;
    /// Zero disables the timeout.
    std::chrono::milliseconds timeout{0};
    /// Polled roughly every 50 ms; returning true kills the child.
    std::function<bool()> should_cancel;
    /// Called with each chunk as it is read.
    std::function<void(OutputStream, std::string_view)> on_output;
    /// Each captured stream keeps at most this many trailing bytes.
    std::size_t max_output_bytes = 1024 * 1024;
};

struct ProcessCapture {
    int exit_code = -1;   // 128 + signal when the child was killed
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool cancelled = false;
    double duration_ms = 0.0;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return exit_code == 0 && !timed_out && !cancelled;
    }
};

/// argv for running `command` through /bin/sh -c.
auto shell_argv(std::string_view command) -> std::vector<std::string>;

/// Runs a child process to completion, streaming its output. The child gets
/// its own process group so a kill also reaches anything it spawned.
/// Errors only when the process cannot be started (ProcessError) or `cwd`
/// is not a directory (InvalidArgument); a non-zero exit is not an error.
auto run_process(const ProcessOptions& options) -> Result<ProcessCapture>;

} // namespace mcptools::infra
