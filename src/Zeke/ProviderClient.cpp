// =================================================================
// src/Zeke/ProviderClient.cpp
// =================================================================
// Default implementations for optional provider operations.

#include "Zeke/ProviderClient.hpp"

namespace Zeke {

CompletionResponse ProviderClient::codeCompletion(const std::string& /*prefix*/,
                                                  const std::string& /*context*/,
                                                  const std::string& /*model*/) {
    throw ProviderError("Code completion is not supported by this provider",
                        ErrorCode::UNSUPPORTED_OPERATION);
}

AnalysisResponse ProviderClient::codeAnalysis(const std::string& /*code*/,
                                              AnalysisType /*analysis_type*/,
                                              const ProjectContext& /*project_context*/) {
    throw ProviderError("Code analysis is not supported by this provider",
                        ErrorCode::UNSUPPORTED_OPERATION);
}

ExplanationResponse ProviderClient::explainCode(const std::string& /*code*/,
                                                const ProjectContext& /*project_context*/) {
    throw ProviderError("Code explanation is not supported by this provider",
                        ErrorCode::UNSUPPORTED_OPERATION);
}

bool ProviderClient::healthCheck() {
    return true;
}

} // namespace Zeke
