// =================================================================
// src/Zeke/ProviderManager.cpp
// =================================================================

#include "Zeke/ProviderManager.hpp"
#include "Zeke/Logger.hpp"
#include <algorithm>

namespace Zeke {

namespace {

constexpr auto HEALTH_STALE_AFTER = std::chrono::seconds(300);
constexpr float UNHEALTHY_PENALTY = 0.1f;
constexpr float ERROR_RATE_DECAY = 0.9f;

} // namespace

bool ProviderConfig::hasCapability(ProviderCapability capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

bool ProviderHealth::isStale() const {
    return std::chrono::system_clock::now() - last_check > HEALTH_STALE_AFTER;
}

nlohmann::json ProviderHealth::toJson() const {
    return nlohmann::json{
        {"provider", providerToString(provider)},
        {"healthy", is_healthy},
        {"response_time_ms", response_time_ms},
        {"error_rate", error_rate},
        {"stale", isStale()}
    };
}

std::vector<ProviderConfig> ProviderManager::defaultConfigs() {
    using C = ProviderCapability;
    std::vector<ProviderConfig> configs;

    ProviderConfig openai;
    openai.provider = ProviderId::OPENAI;
    openai.priority = 8;
    openai.capabilities = {C::CHAT_COMPLETION, C::CODE_COMPLETION, C::CODE_EXPLANATION, C::STREAMING};
    openai.max_requests_per_minute = 60;
    openai.timeout = std::chrono::milliseconds(30000);
    openai.fallback_providers = {ProviderId::CLAUDE, ProviderId::OLLAMA};
    configs.push_back(openai);

    ProviderConfig claude;
    claude.provider = ProviderId::CLAUDE;
    claude.priority = 9;
    claude.capabilities = {C::CHAT_COMPLETION, C::CODE_COMPLETION, C::CODE_ANALYSIS,
                           C::CODE_EXPLANATION, C::STREAMING};
    claude.max_requests_per_minute = 50;
    claude.timeout = std::chrono::milliseconds(45000);
    claude.fallback_providers = {ProviderId::OPENAI, ProviderId::OLLAMA};
    configs.push_back(claude);

    ProviderConfig copilot;
    copilot.provider = ProviderId::COPILOT;
    copilot.priority = 7;
    copilot.capabilities = {C::CODE_COMPLETION, C::CODE_EXPLANATION};
    copilot.max_requests_per_minute = 100;
    copilot.timeout = std::chrono::milliseconds(15000);
    copilot.fallback_providers = {ProviderId::OPENAI, ProviderId::CLAUDE};
    configs.push_back(copilot);

    // Local GPU service: every capability, fast responses
    ProviderConfig ghostllm;
    ghostllm.provider = ProviderId::GHOSTLLM;
    ghostllm.priority = 10;
    ghostllm.capabilities = {C::CHAT_COMPLETION, C::CODE_COMPLETION, C::CODE_ANALYSIS,
                             C::CODE_EXPLANATION, C::CODE_REFACTORING, C::TEST_GENERATION,
                             C::PROJECT_CONTEXT, C::COMMIT_GENERATION, C::SECURITY_SCANNING,
                             C::STREAMING};
    ghostllm.max_requests_per_minute = 200;
    ghostllm.timeout = std::chrono::milliseconds(5000);
    ghostllm.fallback_providers = {ProviderId::CLAUDE, ProviderId::OPENAI};
    configs.push_back(ghostllm);

    ProviderConfig ollama;
    ollama.provider = ProviderId::OLLAMA;
    ollama.priority = 5;
    ollama.capabilities = {C::CHAT_COMPLETION, C::CODE_COMPLETION, C::CODE_EXPLANATION};
    ollama.max_requests_per_minute = 1000;
    ollama.timeout = std::chrono::milliseconds(60000);
    configs.push_back(ollama);

    return configs;
}

ProviderManager::ProviderManager(bool use_defaults) {
    if (use_defaults) {
        for (const auto& config : defaultConfigs()) {
            m_configs[config.provider] = config;
        }
    }
}

void ProviderManager::setProviderConfig(const ProviderConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_configs[config.provider] = config;
}

std::optional<ProviderConfig> ProviderManager::getProviderConfig(ProviderId provider) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_configs.find(provider);
    if (it == m_configs.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ProviderId> ProviderManager::getConfiguredProviders() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ProviderId> providers;
    for (const auto& [provider, config] : m_configs) {
        providers.push_back(provider);
    }
    return providers;
}

void ProviderManager::registerClient(ProviderId provider, std::shared_ptr<ProviderClient> client) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_clients[provider] = std::move(client);
}

std::shared_ptr<ProviderClient> ProviderManager::getClient(ProviderId provider) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_clients.find(provider);
    if (it == m_clients.end()) {
        return nullptr;
    }
    return it->second;
}

float ProviderManager::scoreLocked(const ProviderConfig& config) const {
    float score = static_cast<float>(config.priority);

    auto it = m_health.find(config.provider);
    if (it != m_health.end()) {
        const ProviderHealth& health = it->second;
        if (!health.is_healthy) {
            score *= UNHEALTHY_PENALTY;
        }
        if (health.response_time_ms > 0) {
            score *= 1000.0f / static_cast<float>(health.response_time_ms);
        }
        score *= (1.0f - health.error_rate);
    }
    return score;
}

std::optional<ProviderId> ProviderManager::selectBestProvider(ProviderCapability capability) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::optional<ProviderId> best;
    float best_score = 0.0f;
    for (const auto& [provider, config] : m_configs) {
        if (!config.hasCapability(capability)) {
            continue;
        }
        float score = scoreLocked(config);
        if (!best || score > best_score) {
            best = provider;
            best_score = score;
        }
    }

    if (best) {
        ZEKE_LOG_DEBUG("ProviderManager", "Selected " + providerToString(*best) + " for " +
                       capabilityToString(capability));
    }
    return best;
}

std::vector<ProviderId> ProviderManager::selectProvidersWithFallback(ProviderCapability capability) const {
    std::vector<ProviderId> providers;

    auto primary = selectBestProvider(capability);
    if (!primary) {
        return providers;
    }
    providers.push_back(*primary);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_configs.find(*primary);
    if (it == m_configs.end()) {
        return providers;
    }
    for (ProviderId fallback : it->second.fallback_providers) {
        auto fallback_it = m_configs.find(fallback);
        if (fallback_it != m_configs.end() && fallback_it->second.hasCapability(capability) &&
            std::find(providers.begin(), providers.end(), fallback) == providers.end()) {
            providers.push_back(fallback);
        }
    }
    return providers;
}

std::vector<ProviderId> ProviderManager::listHealthyProviders(ProviderCapability capability) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<ProviderId> providers;
    for (const auto& [provider, config] : m_configs) {
        if (!config.hasCapability(capability)) {
            continue;
        }
        auto it = m_health.find(provider);
        if (it == m_health.end() || it->second.is_healthy) {
            providers.push_back(provider);
        }
    }
    return providers;
}

void ProviderManager::updateHealth(ProviderId provider, bool success, uint64_t response_time_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_health.find(provider);
    if (it == m_health.end()) {
        ProviderHealth fresh;
        fresh.provider = provider;
        it = m_health.emplace(provider, fresh).first;
    }

    ProviderHealth& health = it->second;
    health.is_healthy = success;
    health.last_check = std::chrono::system_clock::now();
    health.response_time_ms = response_time_ms;

    float error_value = success ? 0.0f : 1.0f;
    health.error_rate = health.error_rate * ERROR_RATE_DECAY + error_value * (1.0f - ERROR_RATE_DECAY);

    if (!success) {
        Logger::getInstance().warning("ProviderManager", providerToString(provider) + " marked unhealthy",
                                      "error_rate=" + std::to_string(health.error_rate));
    }
}

bool ProviderManager::healthCheck(ProviderId provider) {
    auto client = getClient(provider);
    if (!client) {
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    bool healthy = false;
    try {
        healthy = client->healthCheck();
    } catch (const std::exception& e) {
        Logger::getInstance().warning("ProviderManager", "Health check for " + providerToString(provider) +
                                      " threw: " + e.what());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    updateHealth(provider, healthy, static_cast<uint64_t>(elapsed.count()));
    return healthy;
}

void ProviderManager::performHealthChecks() {
    std::vector<ProviderId> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [provider, client] : m_clients) {
            auto it = m_health.find(provider);
            if (it == m_health.end() || it->second.isStale()) {
                due.push_back(provider);
            }
        }
    }

    for (ProviderId provider : due) {
        healthCheck(provider);
    }
}

std::optional<ProviderHealth> ProviderManager::getProviderHealth(ProviderId provider) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_health.find(provider);
    if (it == m_health.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json ProviderManager::getHealthReport() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json report = nlohmann::json::array();
    for (const auto& [provider, health] : m_health) {
        report.push_back(health.toJson());
    }
    return report;
}

} // namespace Zeke
