// =================================================================
// src/Zeke/RequestOrchestrator.cpp
// =================================================================

#include "Zeke/RequestOrchestrator.hpp"
#include "Zeke/Logger.hpp"
#include <algorithm>
#include <deque>
#include <optional>
#include <stdexcept>

namespace Zeke {

struct RequestOrchestrator::BatchState {
    BatchState(size_t max_concurrent, size_t count, bool fail_fast_enabled, BatchCallback cb)
        : max_in_flight(max_concurrent), fail_fast(fail_fast_enabled), remaining(count),
          callback(std::move(cb)) {}

    // A member waiting for a slot; it has a task but no executor job yet
    struct Admission {
        TaskId id;
        Executor::Job job;
        RequestPriority priority;
    };

    const size_t max_in_flight;
    bool fail_fast;
    std::atomic<bool> failed{false};
    std::atomic<size_t> remaining;
    BatchCallback callback;

    std::mutex admission_mutex;
    size_t in_flight = 0;
    std::deque<Admission> waiting;

    std::mutex ids_mutex;
    std::vector<TaskId> ids;

    void addId(TaskId id) {
        std::lock_guard<std::mutex> lock(ids_mutex);
        ids.push_back(id);
    }

    std::vector<TaskId> snapshotIds() {
        std::lock_guard<std::mutex> lock(ids_mutex);
        return ids;
    }

    /**
     * @return True if the member took a slot; otherwise it was queued
     */
    bool tryAdmit(Admission& admission) {
        std::lock_guard<std::mutex> lock(admission_mutex);
        if (in_flight < max_in_flight) {
            in_flight++;
            return true;
        }
        waiting.push_back(std::move(admission));
        return false;
    }

    std::optional<Admission> releaseSlot() {
        std::lock_guard<std::mutex> lock(admission_mutex);
        if (waiting.empty()) {
            in_flight--;
            return std::nullopt;
        }
        Admission next = std::move(waiting.front());
        waiting.pop_front();
        return next;
    }
};

RequestOrchestrator::RequestOrchestrator(const OrchestratorConfig& config,
                                         std::shared_ptr<ResponseCache> cache)
    : m_config(config),
      m_cache(std::move(cache)),
      m_dispatch(m_registry),
      m_executor(createExecutor(config.executor_type, config.worker_threads)) {

    if (m_config.enforce_timeouts) {
        m_timeout_thread = std::thread([this] { timeoutLoop(); });
    }

    if (m_config.auto_cleanup) {
        m_cleanup_thread = std::thread([this] { cleanupLoop(); });
    }

    Logger::getInstance().info("RequestOrchestrator",
        "Initialized with " + m_executor->getName() + " executor" +
        (m_cache ? ", response cache enabled" : "") +
        (m_config.enforce_timeouts ? ", timeouts enforced" : ""));
}

RequestOrchestrator::~RequestOrchestrator() {
    shutdown();
}

void RequestOrchestrator::shutdown() {
    if (m_shutdown_requested.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_deadline_mutex);
    }
    m_deadline_cv.notify_all();
    {
        std::lock_guard<std::mutex> lock(m_cleanup_mutex);
    }
    m_cleanup_cv.notify_all();

    if (m_timeout_thread.joinable()) {
        m_timeout_thread.join();
    }
    if (m_cleanup_thread.joinable()) {
        m_cleanup_thread.join();
    }

    auto unfinished = m_registry.activeIds();
    for (TaskId id : unfinished) {
        cancelInternal(id);
    }
    if (!unfinished.empty()) {
        Logger::getInstance().info("RequestOrchestrator", "Cancelled " + std::to_string(unfinished.size()) +
                                   " unfinished requests during shutdown");
    }

    // Queued jobs see cancelled tasks and skip their provider calls
    std::unique_ptr<Executor> executor;
    {
        std::lock_guard<std::recursive_mutex> lock(m_executor_mutex);
        executor = std::move(m_executor);
    }
    executor.reset();
}

bool RequestOrchestrator::submitJob(Executor::Job& job, RequestPriority priority) {
    std::lock_guard<std::recursive_mutex> lock(m_executor_mutex);
    if (!m_executor) {
        return false;
    }
    m_executor->submit(std::move(job), priority);
    return true;
}

// Submission

TaskId RequestOrchestrator::dispatch(TaskKind kind, ProviderId provider, const RequestOptions& options,
                                     WorkerDispatch::ProviderCall call,
                                     std::function<void(const Task&)> on_success,
                                     std::shared_ptr<BatchState> batch) {
    if (m_shutdown_requested.load()) {
        throw std::runtime_error("submit on stopped RequestOrchestrator");
    }

    Task task = m_registry.create(kind, provider, options);
    TaskId id = task.id;
    if (batch) {
        batch->addId(id);
    }

    trackDeadline(id, options.timeout);

    Logger::getInstance().debug("RequestOrchestrator", "Submitted " + taskKindToString(kind) +
                                " task " + std::to_string(id) + " to " + providerToString(provider));

    Executor::Job job = [this, id, call = std::move(call), on_success = std::move(on_success), batch]() {
        auto committed = m_dispatch.run(id, call);
        if (committed && committed->status == TaskStatus::COMPLETED && on_success) {
            try {
                on_success(*committed);
            } catch (const std::exception& e) {
                Logger::getInstance().warning("RequestOrchestrator",
                    "Post-completion hook failed for task " + std::to_string(id) + ": " + e.what());
            }
        }

        if (batch) {
            batchMemberFinished(batch, id);
            admitNextBatchMember(batch);
        }
    };

    if (batch) {
        BatchState::Admission admission{id, std::move(job), options.priority};
        if (batch->tryAdmit(admission)) {
            startBatchMember(batch, id, std::move(admission.job), options.priority);
        }
        return id;
    }

    if (!submitJob(job, options.priority)) {
        cancelInternal(id);
        throw std::runtime_error("submit on stopped RequestOrchestrator");
    }
    return id;
}

TaskId RequestOrchestrator::submitChat(ProviderId provider, std::shared_ptr<ProviderClient> client,
                                       const std::vector<ChatMessage>& messages, const std::string& model,
                                       const RequestOptions& options, std::shared_ptr<BatchState> batch,
                                       bool use_cache) {
    if (!client) {
        throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR,
                                "No client supplied for provider " + providerToString(provider));
    }

    if (m_cache && use_cache) {
        auto cached = m_cache->get(messages, model);
        if (cached) {
            Task task = m_registry.createCompleted(TaskKind::CHAT_COMPLETION, provider, options,
                                                   *cached, true);
            if (batch) {
                batch->addId(task.id);
            }
            Logger::getInstance().debug("RequestOrchestrator", "Cache hit for task " +
                                        std::to_string(task.id) + " (" + model + ")");
            WorkerDispatch::invokeCallback(task);
            if (batch) {
                batchMemberFinished(batch, task.id);
            }
            return task.id;
        }
    }

    auto call = [client, messages, model]() -> TaskResult {
        return client->chatCompletion(messages, model);
    };

    std::function<void(const Task&)> on_success;
    if (m_cache) {
        auto cache = m_cache;
        on_success = [cache, messages, model](const Task& task) {
            if (const ChatResponse* response = task.chatResponse()) {
                cache->put(messages, model, *response);
            }
        };
    }

    return dispatch(TaskKind::CHAT_COMPLETION, provider, options, std::move(call),
                    std::move(on_success), std::move(batch));
}

TaskId RequestOrchestrator::submitChatRequest(ProviderId provider, std::shared_ptr<ProviderClient> client,
                                              const std::vector<ChatMessage>& messages,
                                              const std::string& model, const RequestOptions& options) {
    return submitChat(provider, std::move(client), messages, model, options, nullptr);
}

TaskId RequestOrchestrator::submitCodeCompletionRequest(ProviderId provider,
                                                        std::shared_ptr<ProviderClient> client,
                                                        const std::string& prefix,
                                                        const std::string& context,
                                                        const std::string& model,
                                                        const RequestOptions& options) {
    if (!client) {
        throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR,
                                "No client supplied for provider " + providerToString(provider));
    }
    auto call = [client, prefix, context, model]() -> TaskResult {
        return client->codeCompletion(prefix, context, model);
    };
    return dispatch(TaskKind::CODE_COMPLETION, provider, options, std::move(call));
}

TaskId RequestOrchestrator::submitCodeAnalysisRequest(ProviderId provider,
                                                      std::shared_ptr<ProviderClient> client,
                                                      const std::string& code, AnalysisType analysis_type,
                                                      const ProjectContext& project_context,
                                                      const RequestOptions& options) {
    if (!client) {
        throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR,
                                "No client supplied for provider " + providerToString(provider));
    }
    auto call = [client, code, analysis_type, project_context]() -> TaskResult {
        return client->codeAnalysis(code, analysis_type, project_context);
    };
    return dispatch(TaskKind::CODE_ANALYSIS, provider, options, std::move(call));
}

TaskId RequestOrchestrator::submitCodeExplanationRequest(ProviderId provider,
                                                         std::shared_ptr<ProviderClient> client,
                                                         const std::string& code,
                                                         const ProjectContext& project_context,
                                                         const RequestOptions& options) {
    if (!client) {
        throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR,
                                "No client supplied for provider " + providerToString(provider));
    }
    auto call = [client, code, project_context]() -> TaskResult {
        return client->explainCode(code, project_context);
    };
    return dispatch(TaskKind::CODE_EXPLANATION, provider, options, std::move(call));
}

TaskId RequestOrchestrator::submitHealthCheckRequest(ProviderId provider,
                                                     std::shared_ptr<ProviderClient> client,
                                                     const RequestOptions& options) {
    if (!client) {
        throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR,
                                "No client supplied for provider " + providerToString(provider));
    }
    auto call = [client]() -> TaskResult {
        auto start = std::chrono::steady_clock::now();
        HealthCheckResult result;
        result.healthy = client->healthCheck();
        result.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    };
    return dispatch(TaskKind::HEALTH_CHECK, provider, options, std::move(call));
}

// Batch

std::vector<TaskId> RequestOrchestrator::submitBatchRequests(const std::vector<BatchRequest>& requests,
                                                             const BatchOptions& options) {
    if (options.max_concurrent == 0) {
        throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR, "Batch max_concurrent must be at least 1");
    }

    std::vector<TaskId> ids;
    if (requests.empty()) {
        if (options.callback) {
            options.callback({});
        }
        return ids;
    }

    for (const auto& request : requests) {
        if (!request.client) {
            throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR,
                                    "No client supplied for provider " + providerToString(request.provider));
        }
    }

    auto batch = std::make_shared<BatchState>(options.max_concurrent, requests.size(),
                                              options.fail_fast, options.callback);

    ids.reserve(requests.size());
    try {
        for (const auto& request : requests) {
            RequestOptions member_options = request.options;
            if (options.timeout.count() > 0 &&
                (member_options.timeout.count() == 0 || member_options.timeout > options.timeout)) {
                member_options.timeout = options.timeout;
            }
            ids.push_back(submitChat(request.provider, request.client, request.messages, request.model,
                                     member_options, batch));
        }
    } catch (const std::exception& e) {
        size_t unsubmitted = requests.size() - ids.size();
        Logger::getInstance().error("RequestOrchestrator", "Batch submission stopped after " +
                                    std::to_string(ids.size()) + " of " + std::to_string(requests.size()) +
                                    " requests: " + e.what());
        finishBatchMembers(batch, unsubmitted);
        throw;
    }

    Logger::getInstance().info("RequestOrchestrator", "Submitted batch of " + std::to_string(ids.size()) +
                               " requests, max " + std::to_string(options.max_concurrent) + " concurrent" +
                               (options.fail_fast ? ", fail-fast" : ""));
    return ids;
}

void RequestOrchestrator::batchMemberFinished(const std::shared_ptr<BatchState>& batch, TaskId id) {
    auto task = m_registry.get(id);
    if (task && task->status == TaskStatus::FAILED && batch->fail_fast && !batch->failed.exchange(true)) {
        size_t cancelled = 0;
        for (TaskId member : batch->snapshotIds()) {
            auto status = m_registry.get(member);
            if (status && status->status == TaskStatus::PENDING && cancelInternal(member)) {
                cancelled++;
            }
        }
        Logger::getInstance().warning("RequestOrchestrator", "Batch task " + std::to_string(id) +
                                      " failed, cancelled " + std::to_string(cancelled) + " pending tasks");
    }

    finishBatchMembers(batch, 1);
}

void RequestOrchestrator::finishBatchMembers(const std::shared_ptr<BatchState>& batch, size_t count) {
    if (count == 0 || batch->remaining.fetch_sub(count) != count) {
        return;
    }

    std::vector<Task> members;
    size_t completed = 0, failed = 0, cancelled = 0;
    for (TaskId member : batch->snapshotIds()) {
        auto snapshot = m_registry.get(member);
        if (!snapshot) {
            continue;
        }
        switch (snapshot->status) {
            case TaskStatus::COMPLETED: completed++; break;
            case TaskStatus::FAILED: failed++; break;
            case TaskStatus::CANCELLED: cancelled++; break;
            default: break;
        }
        members.push_back(*snapshot);
    }

    Logger::getInstance().logBatchSummary(members.size(), completed, failed, cancelled);

    if (batch->callback) {
        try {
            batch->callback(members);
        } catch (const std::exception& e) {
            Logger::getInstance().error("RequestOrchestrator", "Batch callback threw: " + std::string(e.what()));
        }
    }
}

void RequestOrchestrator::startBatchMember(const std::shared_ptr<BatchState>& batch, TaskId id,
                                           Executor::Job job, RequestPriority priority) {
    if (batch->fail_fast && batch->failed.load()) {
        cancelInternal(id);
    }

    if (!submitJob(job, priority)) {
        cancelInternal(id);
        job();
    }
}

void RequestOrchestrator::admitNextBatchMember(const std::shared_ptr<BatchState>& batch) {
    auto next = batch->releaseSlot();
    if (next) {
        startBatchMember(batch, next->id, std::move(next->job), next->priority);
    }
}

// Waiting and cancellation

Task RequestOrchestrator::waitForRequest(TaskId id) {
    return m_registry.waitForTerminal(id);
}

std::vector<Task> RequestOrchestrator::waitForAllRequests(const std::vector<TaskId>& ids) {
    std::vector<Task> tasks;
    tasks.reserve(ids.size());
    for (TaskId id : ids) {
        tasks.push_back(m_registry.waitForTerminal(id));
    }
    return tasks;
}

bool RequestOrchestrator::cancelInternal(TaskId id) {
    auto cancelled = m_registry.cancel(id);
    if (!cancelled) {
        return false;
    }
    WorkerDispatch::invokeCallback(*cancelled);
    return true;
}

bool RequestOrchestrator::cancelRequest(TaskId id) {
    if (!m_registry.get(id)) {
        throw OrchestratorError(ErrorCode::REQUEST_NOT_FOUND, "Request not found: " + std::to_string(id));
    }
    return cancelInternal(id);
}

// Race and broadcast

void RequestOrchestrator::validateTargets(const std::vector<ProviderTarget>& targets) const {
    if (targets.empty()) {
        throw OrchestratorError(ErrorCode::NO_PROVIDERS, "No providers to dispatch to");
    }
    for (const auto& target : targets) {
        if (!target.client) {
            throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR,
                                    "No client supplied for provider " + providerToString(target.provider));
        }
    }
}

Task RequestOrchestrator::raceTasks(std::vector<TaskId> ids) {
    size_t contenders = ids.size();

    while (!ids.empty()) {
        auto finished = m_registry.waitForAnyTerminal(ids);
        if (!finished) {
            break;
        }

        if (finished->status == TaskStatus::COMPLETED) {
            for (TaskId other : ids) {
                if (other != finished->id) {
                    cancelInternal(other);
                }
            }
            Logger::getInstance().info("RequestOrchestrator", "Race won by " +
                                       providerToString(finished->provider) + " (task " +
                                       std::to_string(finished->id) + ")");
            return *finished;
        }

        Logger::getInstance().debug("RequestOrchestrator", "Race contender " +
                                    providerToString(finished->provider) + " ended " +
                                    taskStatusToString(finished->status));
        ids.erase(std::remove(ids.begin(), ids.end(), finished->id), ids.end());
    }

    throw OrchestratorError(ErrorCode::ALL_PROVIDERS_FAILED,
                            "All " + std::to_string(contenders) + " providers failed");
}

ChatResponse RequestOrchestrator::raceProviders(const std::vector<ChatMessage>& messages,
                                                const std::vector<ProviderTarget>& targets,
                                                const RequestOptions& options) {
    validateTargets(targets);

    std::vector<TaskId> ids;
    ids.reserve(targets.size());
    for (const auto& target : targets) {
        ids.push_back(submitChatRequest(target.provider, target.client, messages, target.model, options));
    }

    Task winner = raceTasks(std::move(ids));
    return std::get<ChatResponse>(*winner.result);
}

ChatResponse RequestOrchestrator::raceProvidersWithTimeout(const std::vector<ChatMessage>& messages,
                                                           const std::vector<ProviderTarget>& targets,
                                                           std::chrono::milliseconds timeout) {
    RequestOptions options;
    options.timeout = timeout;
    options.priority = RequestPriority::HIGH;
    return raceProviders(messages, targets, options);
}

AnalysisResponse RequestOrchestrator::raceCodeAnalysis(const std::string& code, AnalysisType analysis_type,
                                                       const ProjectContext& project_context,
                                                       const std::vector<ProviderTarget>& targets,
                                                       const RequestOptions& options) {
    validateTargets(targets);

    std::vector<TaskId> ids;
    ids.reserve(targets.size());
    for (const auto& target : targets) {
        ids.push_back(submitCodeAnalysisRequest(target.provider, target.client, code, analysis_type,
                                                project_context, options));
    }

    Task winner = raceTasks(std::move(ids));
    return std::get<AnalysisResponse>(*winner.result);
}

std::vector<ChatResponse> RequestOrchestrator::broadcastToProviders(const std::vector<ChatMessage>& messages,
                                                                    const std::vector<ProviderTarget>& targets,
                                                                    const RequestOptions& options) {
    validateTargets(targets);

    // Every target is asked; the cache key does not tell providers apart
    std::vector<TaskId> ids;
    ids.reserve(targets.size());
    for (const auto& target : targets) {
        ids.push_back(submitChat(target.provider, target.client, messages, target.model, options,
                                 nullptr, false));
    }

    std::vector<ChatResponse> responses;
    for (const Task& task : waitForAllRequests(ids)) {
        if (const ChatResponse* response = task.chatResponse()) {
            responses.push_back(*response);
        } else {
            Logger::getInstance().warning("RequestOrchestrator", "Broadcast to " +
                providerToString(task.provider) + " ended " + taskStatusToString(task.status),
                task.error_info.value_or(""));
        }
    }

    Logger::getInstance().info("RequestOrchestrator", "Broadcast collected " +
                               std::to_string(responses.size()) + " of " +
                               std::to_string(targets.size()) + " responses");
    return responses;
}

// Introspection

std::optional<TaskStatus> RequestOrchestrator::getRequestStatus(TaskId id) const {
    auto task = m_registry.get(id);
    if (!task) {
        return std::nullopt;
    }
    return task->status;
}

std::optional<Task> RequestOrchestrator::getRequest(TaskId id) const {
    return m_registry.get(id);
}

size_t RequestOrchestrator::getActiveRequestCount() const {
    return m_registry.activeCount();
}

size_t RequestOrchestrator::getTrackedRequestCount() const {
    return m_registry.size();
}

RequestStats RequestOrchestrator::getRequestStats() const {
    return m_registry.stats();
}

bool RequestOrchestrator::removeRequest(TaskId id) {
    return m_registry.remove(id);
}

size_t RequestOrchestrator::cleanupCompletedTasks() {
    auto cutoff = std::chrono::system_clock::now() - m_config.cleanup_threshold;
    size_t removed = m_registry.purgeCompletedBefore(cutoff);

    if (removed > 0) {
        Logger::getInstance().info("RequestOrchestrator", "Cleaned up " + std::to_string(removed) +
                                   " completed tasks");
    }

    if (m_cache) {
        auto stats = m_cache->getStatistics();
        Logger::getInstance().logCacheStatistics(stats.entries, stats.max_entries,
                                                 static_cast<size_t>(stats.hits),
                                                 static_cast<size_t>(stats.misses));
    }
    return removed;
}

// Background threads

void RequestOrchestrator::trackDeadline(TaskId id, std::chrono::milliseconds timeout) {
    if (!m_config.enforce_timeouts || timeout.count() <= 0) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_deadline_mutex);
        m_deadlines.emplace(std::chrono::steady_clock::now() + timeout, Deadline{id, timeout});
    }
    m_deadline_cv.notify_one();
}

void RequestOrchestrator::timeoutLoop() {
    std::unique_lock<std::mutex> lock(m_deadline_mutex);

    while (!m_shutdown_requested.load()) {
        if (m_deadlines.empty()) {
            m_deadline_cv.wait(lock, [this] {
                return m_shutdown_requested.load() || !m_deadlines.empty();
            });
            continue;
        }

        auto next = m_deadlines.begin()->first;
        if (std::chrono::steady_clock::now() < next) {
            m_deadline_cv.wait_until(lock, next);
            continue;
        }

        std::vector<Deadline> expired;
        auto now = std::chrono::steady_clock::now();
        while (!m_deadlines.empty() && m_deadlines.begin()->first <= now) {
            expired.push_back(m_deadlines.begin()->second);
            m_deadlines.erase(m_deadlines.begin());
        }

        lock.unlock();
        for (const auto& deadline : expired) {
            auto failed = m_registry.fail(deadline.id,
                "Request timed out after " + std::to_string(deadline.timeout.count()) + "ms",
                ErrorCode::TIMEOUT);
            if (failed) {
                Logger::getInstance().warning("RequestOrchestrator", *failed->error_info,
                                              "task " + std::to_string(deadline.id));
                WorkerDispatch::invokeCallback(*failed);
            }
        }
        lock.lock();
    }
}

void RequestOrchestrator::cleanupLoop() {
    std::unique_lock<std::mutex> lock(m_cleanup_mutex);

    while (!m_shutdown_requested.load()) {
        bool stopping = m_cleanup_cv.wait_for(lock, m_config.cleanup_interval, [this] {
            return m_shutdown_requested.load();
        });
        if (stopping) {
            break;
        }

        lock.unlock();
        cleanupCompletedTasks();
        lock.lock();
    }
}

} // namespace Zeke
