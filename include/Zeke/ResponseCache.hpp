// =================================================================
// include/Zeke/ResponseCache.hpp
// =================================================================
// Two-tier (memory + SQLite) cache of chat responses keyed by request hash.

#pragma once

#include "Zeke/CacheStore.hpp"
#include "Zeke/ProviderTypes.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Zeke {

/**
 * @brief Cache configuration
 */
struct CacheConfig {
    bool enabled = true;
    std::string db_path;                    ///< Empty keeps the cache in memory only
    std::chrono::seconds ttl{3600};
    size_t max_entries = 1000;
    double temperature = 0.7;               ///< Sampling parameters folded into the key
    double top_p = 0.9;
};

/**
 * @brief In-memory cache entry
 */
struct CacheEntry {
    uint64_t input_hash = 0;
    std::string model;
    ChatResponse response;
    std::chrono::system_clock::time_point timestamp;
    uint64_t insertion_seq = 0;             ///< Orders entries inserted in the same instant
    uint64_t access_count = 0;
    std::chrono::system_clock::time_point last_access;
};

struct CacheStatistics {
    size_t entries = 0;
    size_t max_entries = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;
    bool durable = false;

    nlohmann::json toJson() const;
};

/**
 * @brief Response cache in front of the orchestrator
 *
 * Lookups check memory first, then the durable tier, promoting durable hits
 * into memory. Entries expire after the TTL. When a put pushes the memory tier
 * over capacity, the oldest entries are evicted down to 80% of capacity.
 * Durable tier failures are logged and the cache continues in memory only.
 */
class ResponseCache {
public:
    explicit ResponseCache(const CacheConfig& config = CacheConfig{});

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /**
     * @brief Look up a cached response
     * @param messages Request transcript
     * @param model Model identifier
     * @return Cached response if present and fresh
     */
    std::optional<ChatResponse> get(const std::vector<ChatMessage>& messages, const std::string& model);

    /**
     * @brief Store a response in both tiers
     */
    void put(const std::vector<ChatMessage>& messages, const std::string& model,
             const ChatResponse& response);

    /**
     * @brief Drop every entry from both tiers
     */
    void clear();

    /**
     * @brief Drop entries cached for one model
     * @return Memory entries removed
     */
    size_t invalidateModel(const std::string& model);

    /**
     * @brief Cache key for a request under this cache's sampling parameters
     */
    uint64_t computeKey(const std::vector<ChatMessage>& messages, const std::string& model) const;

    size_t size() const;
    bool isEnabled() const { return m_config.enabled; }
    bool hasDurableTier() const;

    CacheStatistics getStatistics() const;

    const CacheConfig& getConfig() const { return m_config; }

private:
    CacheConfig m_config;
    std::unordered_map<uint64_t, CacheEntry> m_entries;
    std::unique_ptr<CacheStore> m_store;
    uint64_t m_next_seq = 0;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    bool m_disabled_logged = false;
    mutable std::mutex m_mutex;

    bool isFresh(std::chrono::system_clock::time_point timestamp,
                 std::chrono::system_clock::time_point now) const;
    void evictIfNeededLocked();
    void disableStoreLocked(const std::exception& e);
    void logDisabledLocked();
};

} // namespace Zeke
