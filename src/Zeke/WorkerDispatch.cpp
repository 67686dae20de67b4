// =================================================================
// src/Zeke/WorkerDispatch.cpp
// =================================================================

#include "Zeke/WorkerDispatch.hpp"
#include "Zeke/Logger.hpp"
#include <chrono>

namespace Zeke {

WorkerDispatch::WorkerDispatch(TaskRegistry& registry) : m_registry(registry) {}

std::optional<Task> WorkerDispatch::run(TaskId id, const ProviderCall& call) {
    auto& logger = Logger::getInstance();

    if (!m_registry.markInProgress(id)) {
        logger.debug("WorkerDispatch", "Skipping provider call for task " + std::to_string(id) +
                     ", no longer pending");
        return std::nullopt;
    }

    auto snapshot = m_registry.get(id);
    std::string provider = snapshot ? providerToString(snapshot->provider) : "unknown";
    std::string operation = snapshot ? taskKindToString(snapshot->kind) : "unknown";

    auto start = std::chrono::steady_clock::now();
    std::optional<TaskResult> result;
    std::string error_message;
    ErrorCode error_code = ErrorCode::PROVIDER_ERROR;

    try {
        result = call();
    } catch (const ProviderError& e) {
        error_message = "Provider " + provider + " failed: " + e.what();
        error_code = e.code();
    } catch (const OrchestratorError& e) {
        error_message = "Provider " + provider + " failed: " + e.what();
        error_code = e.code();
    } catch (const std::exception& e) {
        error_message = "Provider " + provider + " failed: " + e.what();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger.logProviderCall(provider, operation, static_cast<long>(elapsed.count()),
                           result.has_value());

    std::optional<Task> committed;
    if (result) {
        committed = m_registry.complete(id, std::move(*result));
    } else {
        committed = m_registry.fail(id, error_message, error_code);
    }

    if (!committed) {
        logger.debug("WorkerDispatch", "Discarding late outcome for task " + std::to_string(id));
        return std::nullopt;
    }

    if (committed->status == TaskStatus::FAILED) {
        logger.warning("WorkerDispatch", *committed->error_info,
                       "task " + std::to_string(id));
    }

    invokeCallback(*committed);
    return committed;
}

void WorkerDispatch::invokeCallback(const Task& task) {
    if (!task.options.callback) {
        return;
    }

    try {
        task.options.callback(task);
    } catch (const std::exception& e) {
        Logger::getInstance().error("WorkerDispatch", "Callback for task " + std::to_string(task.id) +
                                    " threw: " + e.what());
    }
}

} // namespace Zeke
