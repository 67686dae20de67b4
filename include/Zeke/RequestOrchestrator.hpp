// =================================================================
// include/Zeke/RequestOrchestrator.hpp
// =================================================================
// Concurrent dispatch of requests across providers: submit, wait, cancel,
// batch, race and broadcast.

#pragma once

#include "Zeke/Executor.hpp"
#include "Zeke/ProviderClient.hpp"
#include "Zeke/ResponseCache.hpp"
#include "Zeke/TaskRegistry.hpp"
#include "Zeke/WorkerDispatch.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace Zeke {

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    ExecutorType executor_type = ExecutorType::THREAD_POOL;
    size_t worker_threads = 0;                              ///< 0 = hardware concurrency
    bool enforce_timeouts = true;                           ///< Fail tasks that outlive their timeout
    std::chrono::seconds cleanup_threshold{300};            ///< Age after which terminal tasks are purged
    bool auto_cleanup = false;                              ///< Run cleanup periodically
    std::chrono::seconds cleanup_interval{60};
};

/**
 * @brief A provider plus the client and model used to reach it
 */
struct ProviderTarget {
    ProviderId provider;
    std::shared_ptr<ProviderClient> client;
    std::string model;
};

/**
 * @brief One chat request of a batch
 */
struct BatchRequest {
    ProviderId provider;
    std::shared_ptr<ProviderClient> client;
    std::vector<ChatMessage> messages;
    std::string model;
    RequestOptions options;
};

using BatchCallback = std::function<void(const std::vector<Task>&)>;

/**
 * @brief Batch-wide options
 */
struct BatchOptions {
    size_t max_concurrent = 5;                  ///< Upper bound on in-flight batch calls
    bool fail_fast = false;                     ///< Cancel unadmitted tasks after the first failure
    std::chrono::milliseconds timeout{60000};   ///< Caps each member's timeout; 0 leaves them unchanged
    BatchCallback callback;                     ///< Fires once when every member is terminal
};

/**
 * @brief Public entry point for concurrent provider requests
 *
 * Submissions register a task and return its id without blocking. Tasks are
 * run by the configured Executor. Only the wait, race and broadcast
 * operations block, on the registry's condition variable.
 *
 * Chat submissions consult the ResponseCache first; a hit produces a task
 * that is COMPLETED on creation. Successful chat results populate the cache.
 *
 * Retry policy belongs to callers: RequestOptions::retry_count is stored on
 * the task and never applied here.
 */
class RequestOrchestrator {
public:
    /**
     * @param config Orchestrator configuration
     * @param cache Optional response cache shared with other components
     */
    explicit RequestOrchestrator(const OrchestratorConfig& config = OrchestratorConfig{},
                                 std::shared_ptr<ResponseCache> cache = nullptr);
    ~RequestOrchestrator();

    RequestOrchestrator(const RequestOrchestrator&) = delete;
    RequestOrchestrator& operator=(const RequestOrchestrator&) = delete;

    TaskId submitChatRequest(ProviderId provider, std::shared_ptr<ProviderClient> client,
                             const std::vector<ChatMessage>& messages, const std::string& model,
                             const RequestOptions& options = RequestOptions{});

    TaskId submitCodeCompletionRequest(ProviderId provider, std::shared_ptr<ProviderClient> client,
                                       const std::string& prefix, const std::string& context,
                                       const std::string& model,
                                       const RequestOptions& options = RequestOptions{});

    TaskId submitCodeAnalysisRequest(ProviderId provider, std::shared_ptr<ProviderClient> client,
                                     const std::string& code, AnalysisType analysis_type,
                                     const ProjectContext& project_context,
                                     const RequestOptions& options = RequestOptions{});

    TaskId submitCodeExplanationRequest(ProviderId provider, std::shared_ptr<ProviderClient> client,
                                        const std::string& code, const ProjectContext& project_context,
                                        const RequestOptions& options = RequestOptions{});

    TaskId submitHealthCheckRequest(ProviderId provider, std::shared_ptr<ProviderClient> client,
                                    const RequestOptions& options = RequestOptions{});

    /**
     * @brief Submit chat requests with bounded concurrency
     *
     * Every task is registered before this returns; at most
     * options.max_concurrent of them are in flight at any instant. Members
     * without a slot wait in the batch's own queue, not on an executor worker.
     * @return Task ids in request order
     * @throws std::runtime_error after shutdown; the callback still fires
     */
    std::vector<TaskId> submitBatchRequests(const std::vector<BatchRequest>& requests,
                                            const BatchOptions& options = BatchOptions{});

    /**
     * @brief Block until the task is terminal
     * @throws OrchestratorError(REQUEST_NOT_FOUND)
     */
    Task waitForRequest(TaskId id);

    /**
     * @brief Wait for several tasks
     * @return Terminal tasks in the order of ids
     * @throws OrchestratorError(REQUEST_NOT_FOUND)
     */
    std::vector<Task> waitForAllRequests(const std::vector<TaskId>& ids);

    /**
     * @brief Cancel a task that has not reached a terminal state
     * @return True if this call cancelled the task, false if it was already terminal
     * @throws OrchestratorError(REQUEST_NOT_FOUND)
     */
    bool cancelRequest(TaskId id);

    /**
     * @brief Send the same chat to every target and keep the first success
     *
     * The remaining tasks are cancelled once a winner is known.
     * @throws OrchestratorError(NO_PROVIDERS) if targets is empty
     * @throws OrchestratorError(ALL_PROVIDERS_FAILED) if no task completes
     */
    ChatResponse raceProviders(const std::vector<ChatMessage>& messages,
                               const std::vector<ProviderTarget>& targets,
                               const RequestOptions& options = RequestOptions{});

    /**
     * @brief Race at HIGH priority with a per-request timeout
     */
    ChatResponse raceProvidersWithTimeout(const std::vector<ChatMessage>& messages,
                                          const std::vector<ProviderTarget>& targets,
                                          std::chrono::milliseconds timeout);

    /**
     * @brief Race a code analysis across targets
     */
    AnalysisResponse raceCodeAnalysis(const std::string& code, AnalysisType analysis_type,
                                      const ProjectContext& project_context,
                                      const std::vector<ProviderTarget>& targets,
                                      const RequestOptions& options = RequestOptions{});

    /**
     * @brief Send the same chat to every target and collect all successes
     *
     * Members skip the cache lookup so each answer comes from its own
     * provider; successes are still stored.
     * @return Successful responses in target order; may be empty
     * @throws OrchestratorError(NO_PROVIDERS) if targets is empty
     */
    std::vector<ChatResponse> broadcastToProviders(const std::vector<ChatMessage>& messages,
                                                   const std::vector<ProviderTarget>& targets,
                                                   const RequestOptions& options = RequestOptions{});

    std::optional<TaskStatus> getRequestStatus(TaskId id) const;
    std::optional<Task> getRequest(TaskId id) const;

    /**
     * @brief Tasks that are PENDING or IN_PROGRESS
     */
    size_t getActiveRequestCount() const;

    /**
     * @brief Tasks currently held by the registry, terminal or not
     */
    size_t getTrackedRequestCount() const;

    RequestStats getRequestStats() const;

    /**
     * @brief Forget a task the caller has consumed
     * @return True if the task existed
     */
    bool removeRequest(TaskId id);

    /**
     * @brief Purge terminal tasks older than the cleanup threshold
     * @return Number of tasks removed
     */
    size_t cleanupCompletedTasks();

    /**
     * @brief Stop background threads and cancel unfinished tasks
     */
    void shutdown();

    std::shared_ptr<ResponseCache> getCache() const { return m_cache; }
    const OrchestratorConfig& getConfig() const { return m_config; }

private:
    struct BatchState;

    OrchestratorConfig m_config;
    std::shared_ptr<ResponseCache> m_cache;
    TaskRegistry m_registry;
    WorkerDispatch m_dispatch;

    struct Deadline {
        TaskId id;
        std::chrono::milliseconds timeout;
    };

    // Timeout monitor
    std::multimap<std::chrono::steady_clock::time_point, Deadline> m_deadlines;
    std::mutex m_deadline_mutex;
    std::condition_variable m_deadline_cv;
    std::thread m_timeout_thread;

    // Periodic cleanup
    std::mutex m_cleanup_mutex;
    std::condition_variable m_cleanup_cv;
    std::thread m_cleanup_thread;

    std::atomic<bool> m_shutdown_requested{false};

    // Guards m_executor, which shutdown() moves out before draining it
    std::recursive_mutex m_executor_mutex;

    // Declared last so queued jobs are drained before the members they use go away
    std::unique_ptr<Executor> m_executor;

    /**
     * @param use_cache False skips the cache lookup; a success is still stored
     */
    TaskId submitChat(ProviderId provider, std::shared_ptr<ProviderClient> client,
                      const std::vector<ChatMessage>& messages, const std::string& model,
                      const RequestOptions& options, std::shared_ptr<BatchState> batch,
                      bool use_cache = true);

    /**
     * @brief Hand a job to the executor
     * @return False once shutdown has taken the executor; the job is left untouched
     */
    bool submitJob(Executor::Job& job, RequestPriority priority);

    TaskId dispatch(TaskKind kind, ProviderId provider, const RequestOptions& options,
                    WorkerDispatch::ProviderCall call,
                    std::function<void(const Task&)> on_success = nullptr,
                    std::shared_ptr<BatchState> batch = nullptr);

    void validateTargets(const std::vector<ProviderTarget>& targets) const;

    void trackDeadline(TaskId id, std::chrono::milliseconds timeout);
    void timeoutLoop();
    void cleanupLoop();

    bool cancelInternal(TaskId id);

    /**
     * @brief Wait for the first COMPLETED task and cancel the rest
     * @throws OrchestratorError(ALL_PROVIDERS_FAILED)
     */
    Task raceTasks(std::vector<TaskId> ids);

    void batchMemberFinished(const std::shared_ptr<BatchState>& batch, TaskId id);
    void finishBatchMembers(const std::shared_ptr<BatchState>& batch, size_t count);

    /**
     * @brief Start a batch member that holds an admission slot
     *
     * After shutdown the member is cancelled and its job runs on the calling
     * thread so the batch still settles.
     */
    void startBatchMember(const std::shared_ptr<BatchState>& batch, TaskId id, Executor::Job job,
                          RequestPriority priority);

    /**
     * @brief Pass a finished member's slot to the next waiting member, or free it
     */
    void admitNextBatchMember(const std::shared_ptr<BatchState>& batch);
};

} // namespace Zeke
