// =================================================================
// include/Zeke/Errors.hpp
// =================================================================
// Error taxonomy shared by the orchestrator, cache and provider clients.

#pragma once

#include <stdexcept>
#include <string>

namespace Zeke {

/**
 * @brief Error categories raised or recorded by the core
 */
enum class ErrorCode {
    REQUEST_NOT_FOUND,      ///< Unknown or already purged task id
    NO_PROVIDERS,           ///< Empty candidate list given to race/broadcast
    NO_CANDIDATE_MODELS,    ///< No provider offers the requested capability
    ALL_PROVIDERS_FAILED,   ///< Race finished without a single success
    RATE_LIMIT_EXCEEDED,    ///< Raised by a provider client
    CACHE_NOT_CONFIGURED,   ///< Cache used while disabled (treated as a miss)
    PROVIDER_ERROR,         ///< Opaque provider/network/decode failure
    TIMEOUT,                ///< Request exceeded its timeout
    UNSUPPORTED_OPERATION,  ///< Provider does not implement the operation
    CONFIGURATION_ERROR,    ///< Invalid configuration value
    STORAGE_ERROR           ///< Durable cache tier failure
};

std::string errorCodeToString(ErrorCode code);

/**
 * @brief Exception raised by orchestrator and cache operations
 */
class OrchestratorError : public std::runtime_error {
public:
    OrchestratorError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

/**
 * @brief Exception thrown by ProviderClient implementations
 *
 * Any other std::exception escaping a provider call is recorded as
 * ErrorCode::PROVIDER_ERROR.
 */
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& message, ErrorCode code = ErrorCode::PROVIDER_ERROR)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace Zeke
