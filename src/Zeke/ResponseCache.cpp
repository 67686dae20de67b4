// =================================================================
// src/Zeke/ResponseCache.cpp
// =================================================================

#include "Zeke/ResponseCache.hpp"
#include "Zeke/InputHasher.hpp"
#include "Zeke/Errors.hpp"
#include "Zeke/Logger.hpp"
#include <algorithm>

namespace Zeke {

namespace {

int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t seconds) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::seconds(seconds)));
}

} // namespace

nlohmann::json CacheStatistics::toJson() const {
    return nlohmann::json{
        {"entries", entries},
        {"max_entries", max_entries},
        {"hits", hits},
        {"misses", misses},
        {"hit_rate", hit_rate},
        {"durable", durable}
    };
}

ResponseCache::ResponseCache(const CacheConfig& config) : m_config(config) {
    if (!m_config.enabled || m_config.db_path.empty()) {
        return;
    }

    try {
        m_store = std::make_unique<CacheStore>(m_config.db_path);
    } catch (const OrchestratorError& e) {
        ZEKE_LOG_WARNING("ResponseCache", "Durable tier unavailable, using memory only: " + std::string(e.what()));
    }
}

uint64_t ResponseCache::computeKey(const std::vector<ChatMessage>& messages, const std::string& model) const {
    return InputHasher::hashRequest(model, m_config.temperature, m_config.top_p, messages);
}

bool ResponseCache::isFresh(std::chrono::system_clock::time_point timestamp,
                            std::chrono::system_clock::time_point now) const {
    return now - timestamp < m_config.ttl;
}

void ResponseCache::disableStoreLocked(const std::exception& e) {
    ZEKE_LOG_WARNING("ResponseCache", "Durable tier failed, continuing in memory only: " + std::string(e.what()));
    m_store.reset();
}

void ResponseCache::logDisabledLocked() {
    if (!m_disabled_logged) {
        ZEKE_LOG_DEBUG("ResponseCache", errorCodeToString(ErrorCode::CACHE_NOT_CONFIGURED) +
                       ": cache disabled, lookups miss and stores are ignored");
        m_disabled_logged = true;
    }
}

std::optional<ChatResponse> ResponseCache::get(const std::vector<ChatMessage>& messages,
                                               const std::string& model) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_config.enabled) {
        logDisabledLocked();
        m_misses++;
        return std::nullopt;
    }

    uint64_t key = computeKey(messages, model);
    auto now = std::chrono::system_clock::now();

    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        if (isFresh(it->second.timestamp, now)) {
            it->second.access_count++;
            it->second.last_access = now;
            if (m_store) {
                try {
                    m_store->touch(key, toEpochSeconds(now));
                } catch (const OrchestratorError& e) {
                    disableStoreLocked(e);
                }
            }
            m_hits++;
            return it->second.response;
        }
        m_entries.erase(it);
    }

    if (m_store) {
        try {
            auto stored = m_store->find(key);
            if (stored) {
                auto stored_time = fromEpochSeconds(stored->timestamp);
                if (isFresh(stored_time, now)) {
                    m_store->touch(key, toEpochSeconds(now));

                    CacheEntry entry;
                    entry.input_hash = key;
                    entry.model = stored->model;
                    entry.response = stored->response;
                    entry.timestamp = stored_time;
                    entry.insertion_seq = m_next_seq++;
                    entry.access_count = stored->access_count + 1;
                    entry.last_access = now;
                    m_entries[key] = entry;
                    evictIfNeededLocked();

                    m_hits++;
                    ZEKE_LOG_DEBUG("ResponseCache", "Promoted durable entry for model " + model);
                    return stored->response;
                }
                m_store->erase(key);
            }
        } catch (const OrchestratorError& e) {
            disableStoreLocked(e);
        }
    }

    m_misses++;
    return std::nullopt;
}

void ResponseCache::put(const std::vector<ChatMessage>& messages, const std::string& model,
                        const ChatResponse& response) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_config.enabled) {
        logDisabledLocked();
        return;
    }

    uint64_t key = computeKey(messages, model);
    auto now = std::chrono::system_clock::now();

    CacheEntry entry;
    entry.input_hash = key;
    entry.model = model;
    entry.response = response;
    entry.timestamp = now;
    entry.insertion_seq = m_next_seq++;
    entry.access_count = 0;
    entry.last_access = now;
    m_entries[key] = entry;

    evictIfNeededLocked();

    if (m_store) {
        try {
            StoredResponse row;
            row.input_hash = key;
            row.model = model;
            row.input_text = nlohmann::json(messages).dump();
            row.response = response;
            row.timestamp = toEpochSeconds(now);
            row.access_count = 0;
            row.last_access = toEpochSeconds(now);
            m_store->upsert(row);

            m_store->deleteOlderThan(toEpochSeconds(now - m_config.ttl));
            m_store->trimToSize(m_config.max_entries);
        } catch (const OrchestratorError& e) {
            disableStoreLocked(e);
        }
    }
}

void ResponseCache::evictIfNeededLocked() {
    if (m_entries.size() <= m_config.max_entries) {
        return;
    }

    size_t target = m_config.max_entries - m_config.max_entries / 5;
    size_t to_remove = m_entries.size() - target;

    std::vector<const CacheEntry*> by_age;
    by_age.reserve(m_entries.size());
    for (const auto& [key, entry] : m_entries) {
        by_age.push_back(&entry);
    }
    std::sort(by_age.begin(), by_age.end(), [](const CacheEntry* a, const CacheEntry* b) {
        if (a->timestamp != b->timestamp) {
            return a->timestamp < b->timestamp;
        }
        return a->insertion_seq < b->insertion_seq;
    });

    std::vector<uint64_t> victims;
    victims.reserve(to_remove);
    for (size_t i = 0; i < to_remove; ++i) {
        victims.push_back(by_age[i]->input_hash);
    }
    for (uint64_t key : victims) {
        m_entries.erase(key);
    }

    ZEKE_LOG_DEBUG("ResponseCache", "Evicted " + std::to_string(victims.size()) +
                   " entries, " + std::to_string(m_entries.size()) + " remain");
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    if (m_store) {
        try {
            m_store->clear();
        } catch (const OrchestratorError& e) {
            disableStoreLocked(e);
        }
    }
}

size_t ResponseCache::invalidateModel(const std::string& model) {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.model == model) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (m_store) {
        try {
            m_store->deleteModel(model);
        } catch (const OrchestratorError& e) {
            disableStoreLocked(e);
        }
    }
    return removed;
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool ResponseCache::hasDurableTier() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_store != nullptr;
}

CacheStatistics ResponseCache::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    CacheStatistics stats;
    stats.entries = m_entries.size();
    stats.max_entries = m_config.max_entries;
    stats.hits = m_hits;
    stats.misses = m_misses;
    uint64_t lookups = m_hits + m_misses;
    stats.hit_rate = lookups > 0 ? static_cast<double>(m_hits) / static_cast<double>(lookups) : 0.0;
    stats.durable = m_store != nullptr;
    return stats;
}

} // namespace Zeke
