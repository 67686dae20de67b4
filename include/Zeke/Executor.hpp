// =================================================================
// include/Zeke/Executor.hpp
// =================================================================
// Execution backends that run worker jobs for the orchestrator.

#pragma once

#include "Zeke/Task.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace Zeke {

/**
 * @brief Available execution backends
 */
enum class ExecutorType {
    THREAD_POOL,    ///< Fixed worker threads with a priority queue
    ASYNC,          ///< One std::async task per job
    INLINE          ///< Runs jobs on the submitting thread
};

std::string executorTypeToString(ExecutorType type);

/**
 * @throws std::invalid_argument for unknown names
 */
ExecutorType stringToExecutorType(const std::string& str);

/**
 * @brief Runs fire-and-forget jobs
 *
 * Jobs are expected to handle their own errors. An exception escaping a job
 * is logged by the executor and dropped.
 */
class Executor {
public:
    using Job = std::function<void()>;

    virtual ~Executor() = default;

    /**
     * @brief Schedule a job
     * @param job Work to run
     * @param priority Scheduling hint; only the thread pool orders by it
     */
    virtual void submit(Job job, RequestPriority priority = RequestPriority::NORMAL) = 0;

    /**
     * @brief Number of jobs accepted but not yet started
     */
    virtual size_t pendingJobs() const = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Fixed-size worker pool
 *
 * Jobs are served by priority, FIFO within one priority. The destructor
 * drains the queue before joining the workers.
 */
class ThreadPoolExecutor : public Executor {
public:
    /**
     * @param num_threads Worker count; 0 selects hardware concurrency
     */
    explicit ThreadPoolExecutor(size_t num_threads);
    ~ThreadPoolExecutor() override;

    void submit(Job job, RequestPriority priority = RequestPriority::NORMAL) override;
    size_t pendingJobs() const override;
    std::string getName() const override { return "thread_pool"; }

    size_t getThreadCount() const { return m_workers.size(); }

private:
    struct QueuedJob {
        RequestPriority priority;
        uint64_t sequence;
        std::shared_ptr<Job> job;

        bool operator<(const QueuedJob& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    std::vector<std::thread> m_workers;
    std::priority_queue<QueuedJob> m_jobs;
    uint64_t m_next_sequence = 0;

    mutable std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    bool m_stop = false;

    void workerLoop();
};

/**
 * @brief One std::async task per job
 *
 * Finished futures are reaped on every submit; the destructor waits for all
 * outstanding jobs.
 */
class AsyncExecutor : public Executor {
public:
    AsyncExecutor() = default;
    ~AsyncExecutor() override;

    void submit(Job job, RequestPriority priority = RequestPriority::NORMAL) override;
    size_t pendingJobs() const override;
    std::string getName() const override { return "async"; }

private:
    std::vector<std::future<void>> m_futures;
    mutable std::mutex m_mutex;

    void reapFinishedLocked();
};

/**
 * @brief Synchronous fallback: submit() runs the job before returning
 */
class InlineExecutor : public Executor {
public:
    void submit(Job job, RequestPriority priority = RequestPriority::NORMAL) override;
    size_t pendingJobs() const override { return 0; }
    std::string getName() const override { return "inline"; }
};

/**
 * @brief Create an executor of the requested type
 * @param type Backend
 * @param worker_threads Pool size for THREAD_POOL (0 = hardware concurrency)
 */
std::unique_ptr<Executor> createExecutor(ExecutorType type, size_t worker_threads = 0);

} // namespace Zeke
