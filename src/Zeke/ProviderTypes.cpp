// =================================================================
// src/Zeke/ProviderTypes.cpp
// =================================================================
// String and JSON conversions for provider payload types.

#include "Zeke/ProviderTypes.hpp"
#include <stdexcept>
#include <unordered_map>
#include <algorithm>
#include <cctype>

namespace Zeke {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string providerToString(ProviderId provider) {
    switch (provider) {
        case ProviderId::COPILOT: return "copilot";
        case ProviderId::CLAUDE: return "claude";
        case ProviderId::OPENAI: return "openai";
        case ProviderId::OLLAMA: return "ollama";
        case ProviderId::GHOSTLLM: return "ghostllm";
        case ProviderId::GOOGLE: return "google";
        case ProviderId::AZURE: return "azure";
        case ProviderId::XAI: return "xai";
        default:
            throw std::invalid_argument("Unknown ProviderId value");
    }
}

ProviderId stringToProvider(const std::string& str) {
    static const std::unordered_map<std::string, ProviderId> provider_map = {
        {"copilot", ProviderId::COPILOT},
        {"claude", ProviderId::CLAUDE},
        {"openai", ProviderId::OPENAI},
        {"ollama", ProviderId::OLLAMA},
        {"ghostllm", ProviderId::GHOSTLLM},
        {"google", ProviderId::GOOGLE},
        {"azure", ProviderId::AZURE},
        {"xai", ProviderId::XAI}
    };

    auto it = provider_map.find(toLower(str));
    if (it != provider_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown provider: " + str);
}

std::vector<ProviderId> getAllProviders() {
    return {
        ProviderId::COPILOT, ProviderId::CLAUDE, ProviderId::OPENAI, ProviderId::OLLAMA,
        ProviderId::GHOSTLLM, ProviderId::GOOGLE, ProviderId::AZURE, ProviderId::XAI
    };
}

std::string capabilityToString(ProviderCapability capability) {
    switch (capability) {
        case ProviderCapability::CHAT_COMPLETION: return "chat_completion";
        case ProviderCapability::CODE_COMPLETION: return "code_completion";
        case ProviderCapability::CODE_ANALYSIS: return "code_analysis";
        case ProviderCapability::CODE_EXPLANATION: return "code_explanation";
        case ProviderCapability::CODE_REFACTORING: return "code_refactoring";
        case ProviderCapability::TEST_GENERATION: return "test_generation";
        case ProviderCapability::PROJECT_CONTEXT: return "project_context";
        case ProviderCapability::COMMIT_GENERATION: return "commit_generation";
        case ProviderCapability::SECURITY_SCANNING: return "security_scanning";
        case ProviderCapability::STREAMING: return "streaming";
        default:
            throw std::invalid_argument("Unknown ProviderCapability value");
    }
}

ProviderCapability stringToCapability(const std::string& str) {
    static const std::unordered_map<std::string, ProviderCapability> capability_map = {
        {"chat_completion", ProviderCapability::CHAT_COMPLETION},
        {"code_completion", ProviderCapability::CODE_COMPLETION},
        {"code_analysis", ProviderCapability::CODE_ANALYSIS},
        {"code_explanation", ProviderCapability::CODE_EXPLANATION},
        {"code_refactoring", ProviderCapability::CODE_REFACTORING},
        {"test_generation", ProviderCapability::TEST_GENERATION},
        {"project_context", ProviderCapability::PROJECT_CONTEXT},
        {"commit_generation", ProviderCapability::COMMIT_GENERATION},
        {"security_scanning", ProviderCapability::SECURITY_SCANNING},
        {"streaming", ProviderCapability::STREAMING}
    };

    auto it = capability_map.find(toLower(str));
    if (it != capability_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown capability string: " + str);
}

std::string analysisTypeToString(AnalysisType type) {
    switch (type) {
        case AnalysisType::PERFORMANCE: return "performance";
        case AnalysisType::SECURITY: return "security";
        case AnalysisType::ARCHITECTURE: return "architecture";
        case AnalysisType::STYLE: return "style";
        case AnalysisType::QUALITY: return "quality";
        default:
            throw std::invalid_argument("Unknown AnalysisType value");
    }
}

AnalysisType stringToAnalysisType(const std::string& str) {
    static const std::unordered_map<std::string, AnalysisType> type_map = {
        {"performance", AnalysisType::PERFORMANCE},
        {"security", AnalysisType::SECURITY},
        {"architecture", AnalysisType::ARCHITECTURE},
        {"style", AnalysisType::STYLE},
        {"quality", AnalysisType::QUALITY}
    };

    auto it = type_map.find(toLower(str));
    if (it != type_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown analysis type: " + str);
}

void to_json(nlohmann::json& j, const ChatMessage& message) {
    j = nlohmann::json{{"role", message.role}, {"content", message.content}};
}

void from_json(const nlohmann::json& j, ChatMessage& message) {
    j.at("role").get_to(message.role);
    j.at("content").get_to(message.content);
}

void to_json(nlohmann::json& j, const Usage& usage) {
    j = nlohmann::json{
        {"prompt_tokens", usage.prompt_tokens},
        {"completion_tokens", usage.completion_tokens},
        {"total_tokens", usage.total_tokens}
    };
}

void from_json(const nlohmann::json& j, Usage& usage) {
    usage.prompt_tokens = j.value("prompt_tokens", 0u);
    usage.completion_tokens = j.value("completion_tokens", 0u);
    usage.total_tokens = j.value("total_tokens", 0u);
}

void to_json(nlohmann::json& j, const ChatResponse& response) {
    j = nlohmann::json{{"content", response.content}, {"model", response.model}};
    if (response.usage) {
        j["usage"] = *response.usage;
    }
}

void from_json(const nlohmann::json& j, ChatResponse& response) {
    j.at("content").get_to(response.content);
    j.at("model").get_to(response.model);
    if (j.contains("usage") && !j.at("usage").is_null()) {
        response.usage = j.at("usage").get<Usage>();
    } else {
        response.usage.reset();
    }
}

} // namespace Zeke
