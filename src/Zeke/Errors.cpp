// =================================================================
// src/Zeke/Errors.cpp
// =================================================================

#include "Zeke/Errors.hpp"

namespace Zeke {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::REQUEST_NOT_FOUND: return "RequestNotFound";
        case ErrorCode::NO_PROVIDERS: return "NoProviders";
        case ErrorCode::NO_CANDIDATE_MODELS: return "NoCandidateModels";
        case ErrorCode::ALL_PROVIDERS_FAILED: return "AllProvidersFailed";
        case ErrorCode::RATE_LIMIT_EXCEEDED: return "RateLimitExceeded";
        case ErrorCode::CACHE_NOT_CONFIGURED: return "CacheNotConfigured";
        case ErrorCode::PROVIDER_ERROR: return "ProviderError";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::UNSUPPORTED_OPERATION: return "UnsupportedOperation";
        case ErrorCode::CONFIGURATION_ERROR: return "ConfigurationError";
        case ErrorCode::STORAGE_ERROR: return "StorageError";
        default: return "Unknown";
    }
}

} // namespace Zeke
