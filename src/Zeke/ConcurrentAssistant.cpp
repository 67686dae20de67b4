// =================================================================
// src/Zeke/ConcurrentAssistant.cpp
// =================================================================

#include "Zeke/ConcurrentAssistant.hpp"
#include "Zeke/Logger.hpp"

namespace Zeke {

ConcurrentAssistant::ConcurrentAssistant(ProviderManager& manager,
                                         std::shared_ptr<RequestOrchestrator> orchestrator)
    : m_manager(manager), m_orchestrator(std::move(orchestrator)) {
    if (!m_orchestrator) {
        throw OrchestratorError(ErrorCode::CONFIGURATION_ERROR, "ConcurrentAssistant requires an orchestrator");
    }
}

std::vector<ProviderTarget> ConcurrentAssistant::buildTargets(const std::vector<ProviderId>& providers,
                                                              const std::string& model) const {
    std::vector<ProviderTarget> targets;
    for (ProviderId provider : providers) {
        auto client = m_manager.getClient(provider);
        if (!client) {
            ZEKE_LOG_WARNING("ConcurrentAssistant", "No client registered for " +
                             providerToString(provider) + ", skipping");
            continue;
        }
        targets.push_back(ProviderTarget{provider, client, model});
    }
    return targets;
}

RequestOptions ConcurrentAssistant::healthReportingOptions(std::chrono::milliseconds timeout) const {
    RequestOptions options;
    options.timeout = timeout;

    ProviderManager* manager = &m_manager;
    options.callback = [manager](const Task& task) {
        if (task.status == TaskStatus::CANCELLED || task.from_cache) {
            return;
        }
        auto elapsed = task.duration().value_or(std::chrono::milliseconds(0));
        manager->updateHealth(task.provider, task.status == TaskStatus::COMPLETED,
                              static_cast<uint64_t>(elapsed.count()));
    };
    return options;
}

ChatResponse ConcurrentAssistant::parallelChat(const std::vector<ChatMessage>& messages,
                                               const std::string& model,
                                               const std::vector<ProviderId>& providers) {
    return m_orchestrator->raceProviders(messages, buildTargets(providers, model),
                                         healthReportingOptions(CHAT_TIMEOUT));
}

ChatResponse ConcurrentAssistant::chatWithBestProviders(const std::vector<ChatMessage>& messages,
                                                        const std::string& model) {
    auto candidates = m_manager.selectProvidersWithFallback(ProviderCapability::CHAT_COMPLETION);
    if (candidates.empty()) {
        throw OrchestratorError(ErrorCode::NO_CANDIDATE_MODELS, "No provider offers chat completion");
    }
    return parallelChat(messages, model, candidates);
}

AnalysisResponse ConcurrentAssistant::parallelAnalysis(const std::string& code, AnalysisType analysis_type,
                                                       const ProjectContext& project_context,
                                                       const std::vector<ProviderId>& providers) {
    return m_orchestrator->raceCodeAnalysis(code, analysis_type, project_context,
                                            buildTargets(providers, ""),
                                            healthReportingOptions(ANALYSIS_TIMEOUT));
}

std::vector<ChatResponse> ConcurrentAssistant::broadcastChat(const std::vector<ChatMessage>& messages,
                                                             const std::string& model,
                                                             const std::vector<ProviderId>& providers) {
    return m_orchestrator->broadcastToProviders(messages, buildTargets(providers, model),
                                                healthReportingOptions(CHAT_TIMEOUT));
}

RequestStats ConcurrentAssistant::getStats() const {
    return m_orchestrator->getRequestStats();
}

size_t ConcurrentAssistant::cleanup() {
    return m_orchestrator->cleanupCompletedTasks();
}

} // namespace Zeke
