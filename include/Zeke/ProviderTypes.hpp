// =================================================================
// include/Zeke/ProviderTypes.hpp
// =================================================================
// Provider identities and the request/response payloads exchanged with them.

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace Zeke {

/**
 * @brief Backends the assistant can dispatch to
 */
enum class ProviderId {
    COPILOT,    ///< GitHub Copilot
    CLAUDE,     ///< Anthropic Claude
    OPENAI,     ///< OpenAI
    OLLAMA,     ///< Local Ollama server
    GHOSTLLM,   ///< Local GPU-accelerated service
    GOOGLE,     ///< Google Gemini
    AZURE,      ///< Azure OpenAI
    XAI         ///< xAI Grok
};

/**
 * @brief Capabilities a provider may advertise
 */
enum class ProviderCapability {
    CHAT_COMPLETION,
    CODE_COMPLETION,
    CODE_ANALYSIS,
    CODE_EXPLANATION,
    CODE_REFACTORING,
    TEST_GENERATION,
    PROJECT_CONTEXT,
    COMMIT_GENERATION,
    SECURITY_SCANNING,
    STREAMING
};

/**
 * @brief Kind of code analysis requested
 */
enum class AnalysisType {
    PERFORMANCE,
    SECURITY,
    ARCHITECTURE,
    STYLE,
    QUALITY
};

/**
 * @brief One turn of a chat transcript
 */
struct ChatMessage {
    std::string role;       ///< "system", "user" or "assistant"
    std::string content;    ///< Message text

    bool operator==(const ChatMessage& other) const {
        return role == other.role && content == other.content;
    }
};

/**
 * @brief Token accounting reported by a provider
 */
struct Usage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;

    bool operator==(const Usage& other) const {
        return prompt_tokens == other.prompt_tokens &&
               completion_tokens == other.completion_tokens &&
               total_tokens == other.total_tokens;
    }
};

/**
 * @brief Chat completion result
 */
struct ChatResponse {
    std::string content;            ///< Generated text
    std::string model;              ///< Model that produced it
    std::optional<Usage> usage;     ///< Token usage, if reported

    bool operator==(const ChatResponse& other) const {
        return content == other.content && model == other.model && usage == other.usage;
    }
};

/**
 * @brief Inline code completion result
 */
struct CompletionResponse {
    std::string text;
    std::string model;
    std::optional<Usage> usage;
};

/**
 * @brief Project information handed to analysis and explanation requests
 */
struct ProjectContext {
    std::optional<std::string> project_path;
    std::optional<std::string> git_branch;
    std::optional<std::string> git_commit;
    std::vector<std::string> dependencies;
    std::optional<std::string> framework;
};

/**
 * @brief Code analysis result
 */
struct AnalysisResponse {
    std::string analysis;
    std::vector<std::string> suggestions;
    float confidence = 0.0f;
};

/**
 * @brief Code explanation result
 */
struct ExplanationResponse {
    std::string explanation;
    std::vector<std::string> examples;
    std::vector<std::string> related_concepts;
};

/**
 * @brief Health probe result
 */
struct HealthCheckResult {
    bool healthy = false;
    std::chrono::milliseconds response_time{0};
};

std::string providerToString(ProviderId provider);

/**
 * @throws std::invalid_argument for unknown names
 */
ProviderId stringToProvider(const std::string& str);

std::vector<ProviderId> getAllProviders();

std::string capabilityToString(ProviderCapability capability);

/**
 * @throws std::invalid_argument for unknown names
 */
ProviderCapability stringToCapability(const std::string& str);

std::string analysisTypeToString(AnalysisType type);
AnalysisType stringToAnalysisType(const std::string& str);

// nlohmann::json conversions, found by argument-dependent lookup
void to_json(nlohmann::json& j, const ChatMessage& message);
void from_json(const nlohmann::json& j, ChatMessage& message);
void to_json(nlohmann::json& j, const Usage& usage);
void from_json(const nlohmann::json& j, Usage& usage);
void to_json(nlohmann::json& j, const ChatResponse& response);
void from_json(const nlohmann::json& j, ChatResponse& response);

} // namespace Zeke
