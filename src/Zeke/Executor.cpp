// =================================================================
// src/Zeke/Executor.cpp
// =================================================================

#include "Zeke/Executor.hpp"
#include "Zeke/Logger.hpp"
#include <stdexcept>

namespace Zeke {

namespace {

void runGuarded(const Executor::Job& job, const std::string& executor_name) {
    try {
        job();
    } catch (const std::exception& e) {
        Logger::getInstance().error("Executor", "Job raised an exception: " + std::string(e.what()),
                                    executor_name);
    }
}

} // namespace

std::string executorTypeToString(ExecutorType type) {
    switch (type) {
        case ExecutorType::THREAD_POOL: return "thread_pool";
        case ExecutorType::ASYNC: return "async";
        case ExecutorType::INLINE: return "inline";
        default: return "unknown";
    }
}

ExecutorType stringToExecutorType(const std::string& str) {
    if (str == "thread_pool") return ExecutorType::THREAD_POOL;
    if (str == "async") return ExecutorType::ASYNC;
    if (str == "inline") return ExecutorType::INLINE;
    throw std::invalid_argument("Unknown executor type: " + str);
}

// ThreadPoolExecutor

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;
        }
    }

    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back([this] { workerLoop(); });
    }

    ZEKE_LOG_DEBUG("Executor", "Thread pool started with " + std::to_string(num_threads) + " workers");
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    {
        std::unique_lock<std::mutex> lock(m_queue_mutex);
        m_stop = true;
    }

    m_condition.notify_all();

    for (std::thread& worker : m_workers) {
        worker.join();
    }
}

void ThreadPoolExecutor::workerLoop() {
    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_condition.wait(lock, [this] { return m_stop || !m_jobs.empty(); });

            if (m_stop && m_jobs.empty()) {
                return;
            }

            job = m_jobs.top().job;
            m_jobs.pop();
        }

        runGuarded(*job, getName());
    }
}

void ThreadPoolExecutor::submit(Job job, RequestPriority priority) {
    {
        std::unique_lock<std::mutex> lock(m_queue_mutex);

        if (m_stop) {
            throw std::runtime_error("submit on stopped thread pool");
        }

        m_jobs.push(QueuedJob{priority, m_next_sequence++, std::make_shared<Job>(std::move(job))});
    }

    m_condition.notify_one();
}

size_t ThreadPoolExecutor::pendingJobs() const {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    return m_jobs.size();
}

// AsyncExecutor

AsyncExecutor::~AsyncExecutor() {
    std::vector<std::future<void>> outstanding;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        outstanding.swap(m_futures);
    }

    for (auto& future : outstanding) {
        future.wait();
    }
}

void AsyncExecutor::reapFinishedLocked() {
    for (auto it = m_futures.begin(); it != m_futures.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = m_futures.erase(it);
        } else {
            ++it;
        }
    }
}

void AsyncExecutor::submit(Job job, RequestPriority /*priority*/) {
    std::lock_guard<std::mutex> lock(m_mutex);
    reapFinishedLocked();

    std::string name = getName();
    m_futures.push_back(std::async(std::launch::async, [job = std::move(job), name]() {
        runGuarded(job, name);
    }));
}

size_t AsyncExecutor::pendingJobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t running = 0;
    for (const auto& future : m_futures) {
        if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            running++;
        }
    }
    return running;
}

// InlineExecutor

void InlineExecutor::submit(Job job, RequestPriority /*priority*/) {
    runGuarded(job, getName());
}

std::unique_ptr<Executor> createExecutor(ExecutorType type, size_t worker_threads) {
    switch (type) {
        case ExecutorType::THREAD_POOL:
            return std::make_unique<ThreadPoolExecutor>(worker_threads);
        case ExecutorType::ASYNC:
            return std::make_unique<AsyncExecutor>();
        case ExecutorType::INLINE:
            return std::make_unique<InlineExecutor>();
        default:
            throw std::invalid_argument("Unknown executor type");
    }
}

} // namespace Zeke
