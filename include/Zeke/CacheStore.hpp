// =================================================================
// include/Zeke/CacheStore.hpp
// =================================================================
// SQLite-backed durable tier of the response cache.

#pragma once

#include "Zeke/ProviderTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct sqlite3;

namespace Zeke {

/**
 * @brief One row of the response_cache table
 *
 * Times are seconds since the Unix epoch.
 */
struct StoredResponse {
    uint64_t input_hash = 0;
    std::string model;
    std::string input_text;         ///< JSON transcript
    ChatResponse response;
    int64_t timestamp = 0;
    uint64_t access_count = 0;
    int64_t last_access = 0;
};

/**
 * @brief Owns a SQLite connection holding cached responses
 *
 * Every statement is prepared with bound parameters. Failures throw
 * OrchestratorError(STORAGE_ERROR). Not thread-safe; ResponseCache
 * serializes access.
 */
class CacheStore {
public:
    /**
     * @brief Open (or create) the database and its schema
     * @param db_path Database file; parent directories are created
     */
    explicit CacheStore(const std::string& db_path);
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    std::optional<StoredResponse> find(uint64_t input_hash);

    /**
     * @brief Insert or replace the row for entry.input_hash
     */
    void upsert(const StoredResponse& entry);

    /**
     * @brief Bump access_count and last_access of a row
     */
    void touch(uint64_t input_hash, int64_t now);

    bool erase(uint64_t input_hash);

    /**
     * @brief Delete rows whose timestamp is older than the cutoff
     * @return Rows removed
     */
    size_t deleteOlderThan(int64_t cutoff);

    /**
     * @brief Keep only the newest max_entries rows
     * @return Rows removed
     */
    size_t trimToSize(size_t max_entries);

    size_t deleteModel(const std::string& model);

    size_t count();

    void clear();

    const std::string& getPath() const { return m_path; }

private:
    sqlite3* m_db = nullptr;
    std::string m_path;

    void execute(const std::string& sql);
    [[noreturn]] void raise(const std::string& what) const;
};

} // namespace Zeke
