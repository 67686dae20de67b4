// =================================================================
// include/Zeke/ProviderManager.hpp
// =================================================================
// Provider configuration, health tracking and provider selection.

#pragma once

#include "Zeke/ProviderClient.hpp"
#include "Zeke/ProviderTypes.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Zeke {

/**
 * @brief Static configuration of one provider
 */
struct ProviderConfig {
    ProviderId provider = ProviderId::CLAUDE;
    uint8_t priority = 5;                               ///< 1-10, higher is preferred
    std::vector<ProviderCapability> capabilities;
    uint32_t max_requests_per_minute = 60;
    std::chrono::milliseconds timeout{30000};
    std::vector<ProviderId> fallback_providers;

    bool hasCapability(ProviderCapability capability) const;
};

/**
 * @brief Observed health of one provider
 */
struct ProviderHealth {
    ProviderId provider = ProviderId::CLAUDE;
    bool is_healthy = true;
    std::chrono::system_clock::time_point last_check;
    uint64_t response_time_ms = 0;
    float error_rate = 0.0f;                            ///< Exponential moving average of failures

    /**
     * @brief True when the last check is older than five minutes
     */
    bool isStale() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Tracks provider configs, clients and health
 *
 * Selection scores a provider by its priority, scaled down for poor health,
 * slow responses and a high error rate. Providers without health data are
 * assumed healthy.
 */
class ProviderManager {
public:
    /**
     * @param use_defaults Install the built-in provider configurations
     */
    explicit ProviderManager(bool use_defaults = true);

    void setProviderConfig(const ProviderConfig& config);
    std::optional<ProviderConfig> getProviderConfig(ProviderId provider) const;
    std::vector<ProviderId> getConfiguredProviders() const;

    /**
     * @brief Attach the client used to reach a provider
     */
    void registerClient(ProviderId provider, std::shared_ptr<ProviderClient> client);
    std::shared_ptr<ProviderClient> getClient(ProviderId provider) const;

    /**
     * @brief Pick the best provider offering a capability
     * @return Provider id, or nullopt if none is configured for it
     */
    std::optional<ProviderId> selectBestProvider(ProviderCapability capability) const;

    /**
     * @brief Best provider followed by its fallbacks that share the capability
     */
    std::vector<ProviderId> selectProvidersWithFallback(ProviderCapability capability) const;

    /**
     * @brief Providers offering a capability that are healthy or unchecked
     */
    std::vector<ProviderId> listHealthyProviders(ProviderCapability capability) const;

    /**
     * @brief Record the outcome of a provider call
     * @param provider Provider called
     * @param success Whether the call succeeded
     * @param response_time_ms Observed latency
     */
    void updateHealth(ProviderId provider, bool success, uint64_t response_time_ms);

    /**
     * @brief Probe a provider through its registered client
     * @return Health reported by the client; false without a client
     */
    bool healthCheck(ProviderId provider);

    /**
     * @brief Probe every provider with a client and stale or missing health data
     */
    void performHealthChecks();

    std::optional<ProviderHealth> getProviderHealth(ProviderId provider) const;

    nlohmann::json getHealthReport() const;

    /**
     * @brief Built-in configurations for the known providers
     */
    static std::vector<ProviderConfig> defaultConfigs();

private:
    std::map<ProviderId, ProviderConfig> m_configs;
    std::map<ProviderId, ProviderHealth> m_health;
    std::map<ProviderId, std::shared_ptr<ProviderClient>> m_clients;
    mutable std::mutex m_mutex;

    float scoreLocked(const ProviderConfig& config) const;
};

} // namespace Zeke
