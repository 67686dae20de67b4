// =================================================================
// include/Zeke/ConcurrentAssistant.hpp
// =================================================================
// High-level concurrent AI operations built on the orchestrator and the
// provider manager.

#pragma once

#include "Zeke/ProviderManager.hpp"
#include "Zeke/RequestOrchestrator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Zeke {

/**
 * @brief Races and broadcasts requests across providers chosen by a ProviderManager
 *
 * Every finished provider call is reported back to the manager's health
 * tracking. The manager must outlive any request submitted through this class.
 */
class ConcurrentAssistant {
public:
    static constexpr std::chrono::milliseconds CHAT_TIMEOUT{15000};
    static constexpr std::chrono::milliseconds ANALYSIS_TIMEOUT{30000};

    ConcurrentAssistant(ProviderManager& manager, std::shared_ptr<RequestOrchestrator> orchestrator);

    /**
     * @brief Race a chat across the given providers
     * @throws OrchestratorError(NO_PROVIDERS) when no provider has a client
     * @throws OrchestratorError(ALL_PROVIDERS_FAILED)
     */
    ChatResponse parallelChat(const std::vector<ChatMessage>& messages, const std::string& model,
                              const std::vector<ProviderId>& providers);

    /**
     * @brief Race a chat across the best chat provider and its fallbacks
     * @throws OrchestratorError(NO_CANDIDATE_MODELS) when no provider offers chat
     */
    ChatResponse chatWithBestProviders(const std::vector<ChatMessage>& messages, const std::string& model);

    /**
     * @brief Race a code analysis across the given providers
     */
    AnalysisResponse parallelAnalysis(const std::string& code, AnalysisType analysis_type,
                                      const ProjectContext& project_context,
                                      const std::vector<ProviderId>& providers);

    /**
     * @brief Collect chat responses from every given provider
     */
    std::vector<ChatResponse> broadcastChat(const std::vector<ChatMessage>& messages,
                                            const std::string& model,
                                            const std::vector<ProviderId>& providers);

    RequestStats getStats() const;

    size_t cleanup();

private:
    ProviderManager& m_manager;
    std::shared_ptr<RequestOrchestrator> m_orchestrator;

    std::vector<ProviderTarget> buildTargets(const std::vector<ProviderId>& providers,
                                             const std::string& model) const;
    RequestOptions healthReportingOptions(std::chrono::milliseconds timeout) const;
};

} // namespace Zeke
