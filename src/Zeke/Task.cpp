// =================================================================
// src/Zeke/Task.cpp
// =================================================================

#include "Zeke/Task.hpp"
#include <stdexcept>

namespace Zeke {

bool isTerminalStatus(TaskStatus status) {
    return status == TaskStatus::COMPLETED ||
           status == TaskStatus::FAILED ||
           status == TaskStatus::CANCELLED;
}

bool Task::isTerminal() const {
    return isTerminalStatus(status);
}

std::optional<std::chrono::milliseconds> Task::duration() const {
    if (!completion_time) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*completion_time - start_time);
}

const ChatResponse* Task::chatResponse() const {
    if (!result) {
        return nullptr;
    }
    return std::get_if<ChatResponse>(&*result);
}

nlohmann::json RequestStats::toJson() const {
    return nlohmann::json{
        {"total_submitted", total_submitted},
        {"active", active},
        {"completed", completed},
        {"failed", failed},
        {"cancelled", cancelled},
        {"avg_completion_time_ms", avg_completion_time_ms}
    };
}

std::string taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        case TaskStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

std::string taskKindToString(TaskKind kind) {
    switch (kind) {
        case TaskKind::CHAT_COMPLETION: return "chat_completion";
        case TaskKind::CODE_COMPLETION: return "code_completion";
        case TaskKind::CODE_ANALYSIS: return "code_analysis";
        case TaskKind::CODE_EXPLANATION: return "code_explanation";
        case TaskKind::HEALTH_CHECK: return "health_check";
        default: return "unknown";
    }
}

std::string priorityToString(RequestPriority priority) {
    switch (priority) {
        case RequestPriority::LOW: return "low";
        case RequestPriority::NORMAL: return "normal";
        case RequestPriority::HIGH: return "high";
        case RequestPriority::CRITICAL: return "critical";
        default: return "unknown";
    }
}

RequestPriority stringToPriority(const std::string& str) {
    if (str == "low") return RequestPriority::LOW;
    if (str == "normal") return RequestPriority::NORMAL;
    if (str == "high") return RequestPriority::HIGH;
    if (str == "critical") return RequestPriority::CRITICAL;
    throw std::invalid_argument("Unknown priority: " + str);
}

} // namespace Zeke
