#include "mcptools/tasks/manager.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include <boost/asio/post.hpp>

#include "mcptools/core/logger.hpp"
#include "mcptools/core/utils.hpp"

namespace mcptools::tasks {

namespace detail {

struct TaskRecord {
    TaskSnapshot snapshot;
    std::uint64_t seq = 0;
};

struct TaskTable {
    mutable std::mutex mutex;
    mutable std::condition_variable changed;
    std::unordered_map<std::string, TaskRecord> tasks;
    std::uint64_t next_seq = 0;
};

} // namespace detail

namespace {

auto task_not_found(std::string_view task_id) -> Error {
    return make_error(ErrorCode::TaskNotFound, "Task not found", std::string(task_id));
}

/// Moves a Pending task to Running. Returns false if the task is gone or
/// already terminal (cancelled during shutdown before it got a worker).
auto mark_running(detail::TaskTable& table, const std::string& id) -> bool {
    std::lock_guard lock(table.mutex);
    auto it = table.tasks.find(id);
    if (it == table.tasks.end()) return false;

    auto& snap = it->second.snapshot;
    if (snap.status != TaskStatus::Pending) return false;

    snap.status = TaskStatus::Running;
    snap.updated_at = Clock::now();
    table.changed.notify_all();
    return true;
}

void finish(detail::TaskTable& table, const std::string& id, Result<json> outcome) {
    std::lock_guard lock(table.mutex);
    auto it = table.tasks.find(id);
    if (it == table.tasks.end()) return;

    auto& snap = it->second.snapshot;
    if (is_terminal(snap.status)) return;

    if (outcome) {
        snap.status = TaskStatus::Completed;
        snap.result = std::move(*outcome);
        LOG_INFO("Task {} ({}) completed", id, snap.tool_name);
    } else if (outcome.error().code() == ErrorCode::Cancelled) {
        snap.status = TaskStatus::Cancelled;
        LOG_INFO("Task {} ({}) cancelled", id, snap.tool_name);
    } else {
        snap.status = TaskStatus::Failed;
        snap.error = TaskError{
            .code = outcome.error().code(),
            .message = outcome.error().what(),
        };
        LOG_WARN("Task {} ({}) failed: {}", id, snap.tool_name, outcome.error().what());
    }
    snap.updated_at = Clock::now();
    table.changed.notify_all();
}

void run_task(const std::shared_ptr<detail::TaskTable>& table, const std::string& id,
              const tools::AsyncHandler& handler, const json& arguments) {
    if (!mark_running(*table, id)) {
        LOG_DEBUG("Task {} skipped: no longer pending", id);
        return;
    }

    TaskContext ctx(table, id);
    Result<json> outcome = std::unexpected(
        make_error(ErrorCode::InternalError, "Task handler produced no outcome"));

    try {
        outcome = handler.fn(arguments, ctx);
    } catch (const std::exception& e) {
        LOG_ERROR("Task {} handler threw: {}", id, e.what());
        outcome = std::unexpected(make_error(
            ErrorCode::HandlerFault, "Task handler threw an exception", e.what()));
    } catch (...) {
        LOG_ERROR("Task {} handler threw a non-standard exception", id);
        outcome = std::unexpected(make_error(
            ErrorCode::HandlerFault, "Task handler threw a non-standard exception"));
    }

    finish(*table, id, std::move(outcome));
}

} // anonymous namespace

// -- TaskContext --

TaskContext::TaskContext(std::shared_ptr<detail::TaskTable> table, std::string task_id)
    : table_(std::move(table)), task_id_(std::move(task_id)) {}

void TaskContext::report_progress(json progress) {
    std::lock_guard lock(table_->mutex);
    auto it = table_->tasks.find(task_id_);
    if (it == table_->tasks.end()) return;

    auto& snap = it->second.snapshot;
    if (is_terminal(snap.status)) return;

    snap.progress = std::move(progress);
    snap.updated_at = Clock::now();
    table_->changed.notify_all();
}

auto TaskContext::cancel_requested() const -> bool {
    std::lock_guard lock(table_->mutex);
    auto it = table_->tasks.find(task_id_);
    return it == table_->tasks.end() || it->second.snapshot.cancel_requested;
}

auto TaskContext::cancelled() const -> Error {
    return make_error(ErrorCode::Cancelled, "Task cancelled", task_id_);
}

// -- TaskManager --

TaskManager::TaskManager(std::size_t worker_threads, std::chrono::milliseconds shutdown_grace)
    : table_(std::make_shared<detail::TaskTable>())
    , pool_(std::make_unique<boost::asio::thread_pool>(std::max<std::size_t>(worker_threads, 1)))
    , shutdown_grace_(shutdown_grace)
{
    LOG_DEBUG("Task manager started with {} worker threads",
              std::max<std::size_t>(worker_threads, 1));
}

TaskManager::~TaskManager() {
    shutdown(shutdown_grace_);
}

auto TaskManager::spawn(std::string tool_name, tools::AsyncHandler handler, json arguments)
    -> Result<std::string>
{
    if (is_shut_down()) {
        return std::unexpected(make_error(
            ErrorCode::InternalError, "Task manager is shut down", tool_name));
    }
    if (!handler.fn) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Task handler must not be empty", tool_name));
    }

    auto id = "task-" + utils::generate_uuid();
    auto now = Clock::now();

    {
        std::lock_guard lock(table_->mutex);
        table_->tasks.emplace(id, detail::TaskRecord{
            .snapshot = TaskSnapshot{
                .id = id,
                .tool_name = tool_name,
                .status = TaskStatus::Pending,
                .created_at = now,
                .updated_at = now,
            },
            .seq = table_->next_seq++,
        });
    }

    LOG_INFO("Spawned task {} for tool '{}'", id, tool_name);

    boost::asio::post(*pool_,
        [table = table_, id, handler = std::move(handler),
         arguments = std::move(arguments)]() {
            run_task(table, id, handler, arguments);
        });

    return id;
}

auto TaskManager::status(std::string_view task_id) const -> std::optional<TaskSnapshot> {
    std::lock_guard lock(table_->mutex);
    auto it = table_->tasks.find(std::string(task_id));
    if (it == table_->tasks.end()) return std::nullopt;
    return it->second.snapshot;
}

auto TaskManager::cancel(std::string_view task_id) -> VoidResult {
    std::lock_guard lock(table_->mutex);
    auto it = table_->tasks.find(std::string(task_id));
    if (it == table_->tasks.end()) {
        return std::unexpected(task_not_found(task_id));
    }

    auto& snap = it->second.snapshot;
    if (is_terminal(snap.status)) {
        LOG_DEBUG("Cancel of terminal task {} ignored", task_id);
        return {};
    }

    if (!snap.cancel_requested) {
        snap.cancel_requested = true;
        snap.updated_at = Clock::now();
        LOG_INFO("Cancellation requested for task {}", task_id);
    }
    table_->changed.notify_all();
    return {};
}

auto TaskManager::reap(std::string_view task_id) -> VoidResult {
    std::lock_guard lock(table_->mutex);
    auto it = table_->tasks.find(std::string(task_id));
    if (it == table_->tasks.end()) {
        return std::unexpected(task_not_found(task_id));
    }
    if (!is_terminal(it->second.snapshot.status)) {
        return std::unexpected(make_error(
            ErrorCode::TaskStillRunning, "Task has not finished", std::string(task_id)));
    }

    table_->tasks.erase(it);
    LOG_DEBUG("Reaped task {}", task_id);
    return {};
}

auto TaskManager::list(std::optional<TaskStatus> filter) const -> std::vector<TaskSnapshot> {
    std::vector<const detail::TaskRecord*> records;
    std::vector<TaskSnapshot> result;

    std::lock_guard lock(table_->mutex);
    records.reserve(table_->tasks.size());
    for (const auto& [_, record] : table_->tasks) {
        if (!filter || record.snapshot.status == *filter) {
            records.push_back(&record);
        }
    }
    std::ranges::sort(records, {}, &detail::TaskRecord::seq);

    result.reserve(records.size());
    for (const auto* record : records) {
        result.push_back(record->snapshot);
    }
    return result;
}

auto TaskManager::wait_for_terminal(std::string_view task_id,
                                    std::chrono::milliseconds timeout) const
    -> std::optional<TaskSnapshot>
{
    std::unique_lock lock(table_->mutex);
    std::string key(task_id);

    table_->changed.wait_for(lock, timeout, [&] {
        auto it = table_->tasks.find(key);
        return it == table_->tasks.end() || is_terminal(it->second.snapshot.status);
    });

    auto it = table_->tasks.find(key);
    if (it == table_->tasks.end()) return std::nullopt;
    return it->second.snapshot;
}

auto TaskManager::size() const -> std::size_t {
    std::lock_guard lock(table_->mutex);
    return table_->tasks.size();
}

void TaskManager::shutdown(std::chrono::milliseconds grace) {
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::size_t outstanding = 0;
    {
        std::lock_guard lock(table_->mutex);
        auto now = Clock::now();
        for (auto& [id, record] : table_->tasks) {
            auto& snap = record.snapshot;
            if (is_terminal(snap.status)) continue;

            snap.cancel_requested = true;
            snap.updated_at = now;
            if (snap.status == TaskStatus::Pending) {
                // Never got a worker; nothing will ever run it.
                snap.status = TaskStatus::Cancelled;
            } else {
                ++outstanding;
            }
        }
        table_->changed.notify_all();
    }

    if (outstanding > 0) {
        LOG_INFO("Shutting down: waiting up to {} ms for {} running task(s)",
                 grace.count(), outstanding);
    }

    bool all_done = false;
    {
        std::unique_lock lock(table_->mutex);
        all_done = table_->changed.wait_for(lock, grace, [this] {
            return std::ranges::all_of(table_->tasks, [](const auto& entry) {
                return is_terminal(entry.second.snapshot.status);
            });
        });

        if (!all_done) {
            for (const auto& [id, record] : table_->tasks) {
                if (!is_terminal(record.snapshot.status)) {
                    LOG_WARN("Abandoning task {} ({}) still running at shutdown",
                             id, record.snapshot.tool_name);
                }
            }
        }
    }

    pool_->stop();
    if (all_done) {
        pool_->join();
    } else {
        // Joining would block on handlers that ignore cancellation. The pool
        // is leaked so its threads never outlive state they reference: they
        // hold the table through shared_ptr.
        [[maybe_unused]] auto* abandoned = pool_.release();
    }

    LOG_DEBUG("Task manager shut down");
}

} // namespace mcptools::tasks
