// =================================================================
// include/Zeke/ProviderClient.hpp
// =================================================================
// Abstract capability the orchestrator calls to reach one LLM backend.

#pragma once

#include "Zeke/ProviderTypes.hpp"
#include "Zeke/Errors.hpp"
#include <string>
#include <vector>

namespace Zeke {

/**
 * @brief Interface implemented by every provider adapter
 *
 * Adapters report failures by throwing (ProviderError preferred). The
 * orchestrator only ever records the message and error code of a failure.
 * Implementations must tolerate concurrent calls from several workers.
 */
class ProviderClient {
public:
    virtual ~ProviderClient() = default;

    /**
     * @brief Run a chat completion
     * @param messages Ordered transcript
     * @param model Model identifier understood by the provider
     * @return Provider response
     */
    virtual ChatResponse chatCompletion(const std::vector<ChatMessage>& messages,
                                        const std::string& model) = 0;

    /**
     * @brief Complete code from a prefix
     * @throws ProviderError(UNSUPPORTED_OPERATION) unless overridden
     */
    virtual CompletionResponse codeCompletion(const std::string& prefix,
                                              const std::string& context,
                                              const std::string& model);

    /**
     * @brief Analyse a code fragment
     * @throws ProviderError(UNSUPPORTED_OPERATION) unless overridden
     */
    virtual AnalysisResponse codeAnalysis(const std::string& code,
                                          AnalysisType analysis_type,
                                          const ProjectContext& project_context);

    /**
     * @brief Explain a code fragment
     * @throws ProviderError(UNSUPPORTED_OPERATION) unless overridden
     */
    virtual ExplanationResponse explainCode(const std::string& code,
                                            const ProjectContext& project_context);

    /**
     * @brief Probe the backend
     * @return True if the backend answered
     */
    virtual bool healthCheck();
};

} // namespace Zeke
