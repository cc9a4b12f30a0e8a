#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "mcptools/core/error.hpp"
#include "mcptools/core/types.hpp"
#include "mcptools/tasks/task.hpp"
#include "mcptools/tools/tool.hpp"

namespace mcptools::tasks {

namespace detail {
struct TaskTable;
} // namespace detail

/// Handle given to a running async handler. Lets it publish progress and
/// observe cancellation for its own task; it never owns the record.
class TaskContext {
public:
    TaskContext(std::shared_ptr<detail::TaskTable> table, std::string task_id);

    [[nodiscard]] auto task_id() const noexcept -> const std::string& { return task_id_; }

    /// Replace the task's progress value. Ignored once the task is terminal.
    void report_progress(json progress);

    /// True once cancel() has been called for this task.
    [[nodiscard]] auto cancel_requested() const -> bool;

    /// The error a handler returns to end its task as Cancelled.
    [[nodiscard]] auto cancelled() const -> Error;

private:
    std::shared_ptr<detail::TaskTable> table_;
    std::string task_id_;
};

/// Owns the lifecycle of long-running jobs.
///
/// Handlers run on a private thread pool, independent of the caller. The
/// task table is guarded by a single mutex; every read hands back a full
/// copy of the record. Cancellation is cooperative: cancel() only raises a
/// flag the handler may poll.
///
/// Records live until reap() or shutdown. On shutdown every unfinished task
/// is asked to cancel and given `shutdown_grace` to finish; tasks still
/// running after that are logged and abandoned.
class TaskManager {
public:
    explicit TaskManager(std::size_t worker_threads = 8,
                         std::chrono::milliseconds shutdown_grace = std::chrono::seconds(5));
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    /// Allocate a Pending task and queue `handler` on the pool. Returns the
    /// new task id without waiting. Fails only after shutdown().
    auto spawn(std::string tool_name, tools::AsyncHandler handler, json arguments)
        -> Result<std::string>;

    /// Copy of the task's current state, or nullopt for unknown/reaped ids.
    [[nodiscard]] auto status(std::string_view task_id) const -> std::optional<TaskSnapshot>;

    /// Request cooperative cancellation. TaskNotFound for unknown ids; a
    /// no-op on terminal tasks.
    auto cancel(std::string_view task_id) -> VoidResult;

    /// Remove a terminal task. TaskNotFound / TaskStillRunning otherwise.
    auto reap(std::string_view task_id) -> VoidResult;

    /// All tasks, oldest first, optionally filtered by status.
    [[nodiscard]] auto list(std::optional<TaskStatus> filter = std::nullopt) const
        -> std::vector<TaskSnapshot>;

    /// Block until the task is terminal or `timeout` elapses, then return
    /// its snapshot (nullopt if unknown).
    auto wait_for_terminal(std::string_view task_id, std::chrono::milliseconds timeout) const
        -> std::optional<TaskSnapshot>;

    [[nodiscard]] auto size() const -> std::size_t;

    /// Stop accepting tasks, cancel unfinished ones and wait up to `grace`.
    /// Idempotent.
    void shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] auto is_shut_down() const noexcept -> bool {
        return shut_down_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::TaskTable> table_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::chrono::milliseconds shutdown_grace_;
    std::atomic<bool> shut_down_{false};
};

} // namespace mcptools::tasks
