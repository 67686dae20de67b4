// =================================================================
// include/Zeke/WorkerDispatch.hpp
// =================================================================
// Runs one provider call for a task and commits its terminal state.

#pragma once

#include "Zeke/TaskRegistry.hpp"
#include <functional>
#include <optional>

namespace Zeke {

/**
 * @brief Executes the provider call behind a registered task
 *
 * Cancellation is cooperative: a call that is already running is never
 * interrupted. If the task became terminal while the call ran, the outcome
 * is discarded.
 */
class WorkerDispatch {
public:
    using ProviderCall = std::function<TaskResult()>;

    explicit WorkerDispatch(TaskRegistry& registry);

    /**
     * @brief Run the call for a task
     *
     * Skips the call if the task is no longer PENDING. Invokes the task
     * callback when this worker commits the terminal transition.
     * @param id Task to run
     * @param call Provider call producing the result
     * @return Task committed by this worker, or nullopt if the call was
     *         skipped or its outcome discarded
     */
    std::optional<Task> run(TaskId id, const ProviderCall& call);

    /**
     * @brief Invoke a finalized task's callback, logging anything it throws
     */
    static void invokeCallback(const Task& task);

private:
    TaskRegistry& m_registry;
};

} // namespace Zeke
