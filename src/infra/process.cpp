#include "mcptools/infra/process.hpp"

#include "mcptools/core/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcptools::infra {

namespace {

void set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) static_cast<void>(close(fds[i]));
        fds[i] = -1;
    }
}

void append_capped(std::string& out, std::string_view chunk, std::size_t cap) {
    out.append(chunk);
    // Trim in bulk so long-running output does not shift on every read.
    if (cap > 0 && out.size() > cap * 2) {
        out.erase(0, out.size() - cap);
    }
}

void drain_pipe(int fd, bool& is_open, OutputStream stream,
                std::string& out, const ProcessOptions& options) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::string_view chunk(buffer, static_cast<std::size_t>(n));
            append_capped(out, chunk, options.max_output_bytes);
            if (options.on_output) {
                options.on_output(stream, chunk);
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void finalize_capture(std::string& out, std::size_t cap) {
    if (cap > 0 && out.size() > cap) {
        out.erase(0, out.size() - cap);
    }
}

} // anonymous namespace

auto shell_argv(std::string_view command) -> std::vector<std::string> {
    return {"/bin/sh", "-c", std::string(command)};
}

auto run_process(const ProcessOptions& options) -> Result<ProcessCapture> {
    if (options.argv.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Process argv must not be empty"));
    }

    std::error_code ec;
    if (!options.cwd.empty() && !std::filesystem::is_directory(options.cwd, ec)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Working directory does not exist", options.cwd.string()));
    }

    if (options.should_cancel && options.should_cancel()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    // argv must outlive the exec call in the child.
    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // Close-on-exec keeps concurrent runs from leaking write ends into each
    // other's children; dup2 clears the flag on the child's fds 1 and 2.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        auto reason = std::string(std::strerror(errno));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return std::unexpected(make_error(
            ErrorCode::ProcessError, "Failed to create process pipes", reason));
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        auto reason = std::string(std::strerror(errno));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return std::unexpected(make_error(
            ErrorCode::ProcessError, "Failed to fork process", reason));
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(126);
        }
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    LOG_DEBUG("Started process {} (pid {})", options.argv.front(), pid);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    // The group outlives a reaped child while anything it spawned is alive,
    // so signalling -pid stays valid; the bare pid is only signalled while
    // it has not been reaped.
    auto kill_child = [&] {
        if (!killed) {
            static_cast<void>(kill(-pid, SIGKILL));
            if (!child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
            killed = true;
        }
    };

    while (stdout_open || stderr_open || !child_exited) {
        if (!capture.cancelled && options.should_cancel && options.should_cancel()) {
            capture.cancelled = true;
            kill_child();
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (!capture.timed_out && options.timeout.count() > 0 &&
            elapsed > options.timeout) {
            capture.timed_out = true;
            kill_child();
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            // Only waiting on the child now.
            static_cast<void>(poll(nullptr, 0, 50));
        }

        drain_pipe(stdout_pipe[0], stdout_open, OutputStream::Stdout,
                   capture.stdout_text, options);
        drain_pipe(stderr_pipe[0], stderr_open, OutputStream::Stderr,
                   capture.stderr_text, options);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A background grandchild can hold the pipes open after the child
        // exits; once a deadline or cancel has fired, stop waiting for EOF.
        if (child_exited && killed) {
            if (stdout_open) { static_cast<void>(close(stdout_pipe[0])); stdout_open = false; }
            if (stderr_open) { static_cast<void>(close(stderr_pipe[0])); stderr_open = false; }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    finalize_capture(capture.stdout_text, options.max_output_bytes);
    finalize_capture(capture.stderr_text, options.max_output_bytes);

    capture.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    LOG_DEBUG("Process {} exited with {} after {:.0f} ms",
              pid, capture.exit_code, capture.duration_ms);
    return capture;
}

} // namespace mcptools::infra
