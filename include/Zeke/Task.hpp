// =================================================================
// include/Zeke/Task.hpp
// =================================================================
// Task value object tracked by the orchestrator for every provider request.

#pragma once

#include "Zeke/ProviderTypes.hpp"
#include "Zeke/Errors.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace Zeke {

using TaskId = uint64_t;

/**
 * @brief Request kinds the orchestrator can dispatch
 */
enum class TaskKind {
    CHAT_COMPLETION,
    CODE_COMPLETION,
    CODE_ANALYSIS,
    CODE_EXPLANATION,
    HEALTH_CHECK
};

/**
 * @brief Task lifecycle states
 *
 * PENDING -> IN_PROGRESS -> {COMPLETED, FAILED, CANCELLED}. CANCELLED and
 * FAILED are also reachable straight from PENDING. Terminal states are final.
 */
enum class TaskStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
    CANCELLED
};

/**
 * @brief Scheduling priority; orders the thread-pool queue
 */
enum class RequestPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

/**
 * @brief Successful payload of a task, one alternative per TaskKind
 */
using TaskResult = std::variant<ChatResponse,
                                CompletionResponse,
                                AnalysisResponse,
                                ExplanationResponse,
                                HealthCheckResult>;

struct Task;

using TaskCallback = std::function<void(const Task&)>;

/**
 * @brief Per-request options
 *
 * retry_count is carried for callers that implement their own retry policy;
 * the orchestrator never retries a request.
 */
struct RequestOptions {
    std::chrono::milliseconds timeout{30000};   ///< 0 disables the deadline
    uint8_t retry_count = 3;
    RequestPriority priority = RequestPriority::NORMAL;
    TaskCallback callback;                      ///< Invoked once, after the terminal transition
};

/**
 * @brief Snapshot of one tracked request
 */
struct Task {
    TaskId id = 0;
    ProviderId provider = ProviderId::CLAUDE;
    TaskKind kind = TaskKind::CHAT_COMPLETION;
    TaskStatus status = TaskStatus::PENDING;
    std::optional<TaskResult> result;           ///< Present only when COMPLETED
    std::optional<std::string> error_info;      ///< Present only when FAILED
    std::optional<ErrorCode> error_code;        ///< Present only when FAILED
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> completion_time;
    RequestOptions options;
    bool from_cache = false;

    bool isTerminal() const;

    /**
     * @brief Duration between start and completion
     * @return Elapsed time, or nullopt while the task is still running
     */
    std::optional<std::chrono::milliseconds> duration() const;

    /**
     * @brief Chat payload of a completed chat task
     * @return Pointer into result, or nullptr for other kinds/states
     */
    const ChatResponse* chatResponse() const;
};

/**
 * @brief Aggregated registry statistics
 */
struct RequestStats {
    uint64_t total_submitted = 0;       ///< Monotonic, survives purges
    size_t active = 0;                  ///< PENDING + IN_PROGRESS
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    double avg_completion_time_ms = 0.0;

    nlohmann::json toJson() const;
};

bool isTerminalStatus(TaskStatus status);
std::string taskStatusToString(TaskStatus status);
std::string taskKindToString(TaskKind kind);
std::string priorityToString(RequestPriority priority);

/**
 * @throws std::invalid_argument for unknown names
 */
RequestPriority stringToPriority(const std::string& str);

} // namespace Zeke
