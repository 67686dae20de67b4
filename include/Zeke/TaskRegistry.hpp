// =================================================================
// include/Zeke/TaskRegistry.hpp
// =================================================================
// Thread-safe map of tracked tasks with state transitions and waits.

#pragma once

#include "Zeke/Task.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace Zeke {

/**
 * @brief Owns every tracked Task and serializes its transitions
 *
 * All mutation happens under a single mutex. Every terminal transition and
 * every removal notifies the waiters. Tasks are handed out as copies so no
 * caller ever holds a reference into the map.
 */
class TaskRegistry {
public:
    TaskRegistry() = default;

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * @brief Register a new PENDING task
     * @param kind Request kind
     * @param provider Target provider
     * @param options Request options (callback included)
     * @return Snapshot of the registered task
     */
    Task create(TaskKind kind, ProviderId provider, const RequestOptions& options);

    /**
     * @brief Register a task that is already COMPLETED
     *
     * Used for requests satisfied without dispatch (cache hits).
     * @return Snapshot of the registered task
     */
    Task createCompleted(TaskKind kind, ProviderId provider, const RequestOptions& options,
                         TaskResult result, bool from_cache);

    std::optional<Task> get(TaskId id) const;

    /**
     * @brief Forget a task
     * @return True if the task existed
     */
    bool remove(TaskId id);

    /**
     * @brief PENDING -> IN_PROGRESS
     * @return True if the transition applied
     */
    bool markInProgress(TaskId id);

    /**
     * @brief Commit a successful result
     * @return Finalized task if this call performed the transition
     */
    std::optional<Task> complete(TaskId id, TaskResult result);

    /**
     * @brief Commit a failure
     * @return Finalized task if this call performed the transition
     */
    std::optional<Task> fail(TaskId id, const std::string& error_info, ErrorCode code);

    /**
     * @brief Cancel a non-terminal task
     * @return Finalized task if this call performed the transition
     */
    std::optional<Task> cancel(TaskId id);

    /**
     * @brief Block until the task is terminal
     * @throws OrchestratorError(REQUEST_NOT_FOUND) if the id is unknown or
     *         the task is removed while waiting
     */
    Task waitForTerminal(TaskId id) const;

    /**
     * @brief Block until one of the given tasks is terminal
     *
     * Ids that are not tracked are ignored. When several tasks are terminal,
     * the first one in the order of ids is returned.
     * @return Terminal task, or nullopt if none of the ids is tracked
     */
    std::optional<Task> waitForAnyTerminal(const std::vector<TaskId>& ids) const;

    /**
     * @brief Remove terminal tasks completed before the cutoff
     * @return Number of tasks removed
     */
    size_t purgeCompletedBefore(std::chrono::system_clock::time_point cutoff);

    RequestStats stats() const;

    size_t activeCount() const;

    /**
     * @brief Ids of tasks that are PENDING or IN_PROGRESS
     */
    std::vector<TaskId> activeIds() const;

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_terminal_cv;
    std::map<TaskId, Task> m_tasks;
    TaskId m_next_id = 1;
    std::atomic<uint64_t> m_total_submitted{0};

    Task& insertLocked(TaskKind kind, ProviderId provider, const RequestOptions& options);
};

} // namespace Zeke
