// =================================================================
// src/Zeke/TaskRegistry.cpp
// =================================================================

#include "Zeke/TaskRegistry.hpp"
#include "Zeke/Logger.hpp"

namespace Zeke {

Task& TaskRegistry::insertLocked(TaskKind kind, ProviderId provider, const RequestOptions& options) {
    Task task;
    task.id = m_next_id++;
    task.provider = provider;
    task.kind = kind;
    task.status = TaskStatus::PENDING;
    task.start_time = std::chrono::system_clock::now();
    task.options = options;

    m_total_submitted.fetch_add(1);
    auto result = m_tasks.emplace(task.id, std::move(task));
    return result.first->second;
}

Task TaskRegistry::create(TaskKind kind, ProviderId provider, const RequestOptions& options) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return insertLocked(kind, provider, options);
}

Task TaskRegistry::createCompleted(TaskKind kind, ProviderId provider, const RequestOptions& options,
                                   TaskResult result, bool from_cache) {
    Task snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Task& task = insertLocked(kind, provider, options);
        task.status = TaskStatus::COMPLETED;
        task.result = std::move(result);
        task.completion_time = task.start_time;
        task.from_cache = from_cache;
        snapshot = task;
    }
    m_terminal_cv.notify_all();
    return snapshot;
}

std::optional<Task> TaskRegistry::get(TaskId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TaskRegistry::remove(TaskId id) {
    bool removed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        removed = m_tasks.erase(id) > 0;
    }
    if (removed) {
        m_terminal_cv.notify_all();
    }
    return removed;
}

bool TaskRegistry::markInProgress(TaskId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end() || it->second.status != TaskStatus::PENDING) {
        return false;
    }
    it->second.status = TaskStatus::IN_PROGRESS;
    Logger::getInstance().logTaskTransition(id, "PENDING", "IN_PROGRESS");
    return true;
}

std::optional<Task> TaskRegistry::complete(TaskId id, TaskResult result) {
    Task snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tasks.find(id);
        if (it == m_tasks.end() || it->second.isTerminal()) {
            return std::nullopt;
        }
        Task& task = it->second;
        std::string from = taskStatusToString(task.status);
        task.status = TaskStatus::COMPLETED;
        task.result = std::move(result);
        task.completion_time = std::chrono::system_clock::now();
        snapshot = task;
        Logger::getInstance().logTaskTransition(id, from, "COMPLETED");
    }
    m_terminal_cv.notify_all();
    return snapshot;
}

std::optional<Task> TaskRegistry::fail(TaskId id, const std::string& error_info, ErrorCode code) {
    Task snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tasks.find(id);
        if (it == m_tasks.end() || it->second.isTerminal()) {
            return std::nullopt;
        }
        Task& task = it->second;
        std::string from = taskStatusToString(task.status);
        task.status = TaskStatus::FAILED;
        task.error_info = error_info;
        task.error_code = code;
        task.completion_time = std::chrono::system_clock::now();
        snapshot = task;
        Logger::getInstance().logTaskTransition(id, from, "FAILED");
    }
    m_terminal_cv.notify_all();
    return snapshot;
}

std::optional<Task> TaskRegistry::cancel(TaskId id) {
    Task snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tasks.find(id);
        if (it == m_tasks.end() || it->second.isTerminal()) {
            return std::nullopt;
        }
        Task& task = it->second;
        std::string from = taskStatusToString(task.status);
        task.status = TaskStatus::CANCELLED;
        task.completion_time = std::chrono::system_clock::now();
        snapshot = task;
        Logger::getInstance().logTaskTransition(id, from, "CANCELLED");
    }
    m_terminal_cv.notify_all();
    return snapshot;
}

Task TaskRegistry::waitForTerminal(TaskId id) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        auto it = m_tasks.find(id);
        if (it == m_tasks.end()) {
            throw OrchestratorError(ErrorCode::REQUEST_NOT_FOUND,
                                    "Request not found: " + std::to_string(id));
        }
        if (it->second.isTerminal()) {
            return it->second;
        }
        m_terminal_cv.wait(lock);
    }
}

std::optional<Task> TaskRegistry::waitForAnyTerminal(const std::vector<TaskId>& ids) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        bool any_tracked = false;
        for (TaskId id : ids) {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end()) {
                continue;
            }
            any_tracked = true;
            if (it->second.isTerminal()) {
                return it->second;
            }
        }
        if (!any_tracked) {
            return std::nullopt;
        }
        m_terminal_cv.wait(lock);
    }
}

size_t TaskRegistry::purgeCompletedBefore(std::chrono::system_clock::time_point cutoff) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_tasks.begin(); it != m_tasks.end();) {
            const Task& task = it->second;
            if (task.isTerminal() && task.completion_time && *task.completion_time < cutoff) {
                it = m_tasks.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        m_terminal_cv.notify_all();
    }
    return removed;
}

RequestStats TaskRegistry::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    RequestStats stats;
    stats.total_submitted = m_total_submitted.load();

    double total_ms = 0.0;
    size_t timed = 0;
    for (const auto& [id, task] : m_tasks) {
        switch (task.status) {
            case TaskStatus::PENDING:
            case TaskStatus::IN_PROGRESS:
                stats.active++;
                break;
            case TaskStatus::COMPLETED:
                stats.completed++;
                if (auto elapsed = task.duration()) {
                    total_ms += static_cast<double>(elapsed->count());
                    timed++;
                }
                break;
            case TaskStatus::FAILED:
                stats.failed++;
                break;
            case TaskStatus::CANCELLED:
                stats.cancelled++;
                break;
        }
    }

    if (timed > 0) {
        stats.avg_completion_time_ms = total_ms / static_cast<double>(timed);
    }
    return stats;
}

size_t TaskRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t active = 0;
    for (const auto& [id, task] : m_tasks) {
        if (!task.isTerminal()) {
            active++;
        }
    }
    return active;
}

std::vector<TaskId> TaskRegistry::activeIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TaskId> ids;
    for (const auto& [id, task] : m_tasks) {
        if (!task.isTerminal()) {
            ids.push_back(id);
        }
    }
    return ids;
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

} // namespace Zeke
