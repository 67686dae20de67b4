// =================================================================
// src/Zeke/CacheStore.cpp
// =================================================================

#include "Zeke/CacheStore.hpp"
#include "Zeke/Errors.hpp"
#include "Zeke/Logger.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace Zeke {

namespace {

const char* SCHEMA_SQL = R"(
CREATE TABLE IF NOT EXISTS response_cache (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    input_hash INTEGER UNIQUE NOT NULL,
    model TEXT NOT NULL,
    input_text TEXT NOT NULL,
    response_content TEXT NOT NULL,
    response_model TEXT NOT NULL,
    prompt_tokens INTEGER,
    completion_tokens INTEGER,
    total_tokens INTEGER,
    timestamp INTEGER NOT NULL,
    access_count INTEGER NOT NULL DEFAULT 0,
    last_access INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_response_cache_input_hash ON response_cache(input_hash);
CREATE INDEX IF NOT EXISTS idx_response_cache_model ON response_cache(model);
CREATE INDEX IF NOT EXISTS idx_response_cache_timestamp ON response_cache(timestamp);
CREATE INDEX IF NOT EXISTS idx_response_cache_access_count ON response_cache(access_count);
)";

// Finalizes the prepared statement on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : m_db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw OrchestratorError(ErrorCode::STORAGE_ERROR,
                                    std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        sqlite3_finalize(m_stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, int64_t value) {
        check(sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value)));
    }

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void bindNull(int index) {
        check(sqlite3_bind_null(m_stmt, index));
    }

    // True while a row is available
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw OrchestratorError(ErrorCode::STORAGE_ERROR,
                                std::string("Statement failed: ") + sqlite3_errmsg(m_db));
    }

    int64_t columnInt(int column) const {
        return static_cast<int64_t>(sqlite3_column_int64(m_stmt, column));
    }

    bool columnIsNull(int column) const {
        return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
    }

    std::string columnText(int column) const {
        const unsigned char* text = sqlite3_column_text(m_stmt, column);
        if (!text) {
            return "";
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(m_stmt, column)));
    }

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw OrchestratorError(ErrorCode::STORAGE_ERROR,
                                    std::string("Failed to bind parameter: ") + sqlite3_errmsg(m_db));
        }
    }
};

int64_t toStoredHash(uint64_t hash) {
    return static_cast<int64_t>(hash);
}

} // namespace

CacheStore::CacheStore(const std::string& db_path) : m_path(db_path) {
    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            raise("Failed to create cache directory " + parent.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open(db_path.c_str(), &m_db) != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        raise("Failed to open cache database " + db_path + ": " + message);
    }

    try {
        execute(SCHEMA_SQL);
    } catch (...) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }

    Logger::getInstance().info("CacheStore", "Opened durable cache", db_path);
}

CacheStore::~CacheStore() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void CacheStore::raise(const std::string& what) const {
    throw OrchestratorError(ErrorCode::STORAGE_ERROR, what);
}

void CacheStore::execute(const std::string& sql) {
    char* error_message = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &error_message) != SQLITE_OK) {
        std::string message = error_message ? error_message : "unknown error";
        sqlite3_free(error_message);
        raise("SQL execution failed: " + message);
    }
}

std::optional<StoredResponse> CacheStore::find(uint64_t input_hash) {
    Statement stmt(m_db,
        "SELECT model, input_text, response_content, response_model, prompt_tokens, "
        "completion_tokens, total_tokens, timestamp, access_count, last_access "
        "FROM response_cache WHERE input_hash = ?");
    stmt.bind(1, toStoredHash(input_hash));

    if (!stmt.step()) {
        return std::nullopt;
    }

    StoredResponse entry;
    entry.input_hash = input_hash;
    entry.model = stmt.columnText(0);
    entry.input_text = stmt.columnText(1);
    entry.response.content = stmt.columnText(2);
    entry.response.model = stmt.columnText(3);
    if (!stmt.columnIsNull(6)) {
        Usage usage;
        usage.prompt_tokens = static_cast<uint32_t>(stmt.columnInt(4));
        usage.completion_tokens = static_cast<uint32_t>(stmt.columnInt(5));
        usage.total_tokens = static_cast<uint32_t>(stmt.columnInt(6));
        entry.response.usage = usage;
    }
    entry.timestamp = stmt.columnInt(7);
    entry.access_count = static_cast<uint64_t>(stmt.columnInt(8));
    entry.last_access = stmt.columnInt(9);
    return entry;
}

void CacheStore::upsert(const StoredResponse& entry) {
    Statement stmt(m_db,
        "INSERT OR REPLACE INTO response_cache (input_hash, model, input_text, response_content, "
        "response_model, prompt_tokens, completion_tokens, total_tokens, timestamp, access_count, "
        "last_access) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, toStoredHash(entry.input_hash));
    stmt.bind(2, entry.model);
    stmt.bind(3, entry.input_text);
    stmt.bind(4, entry.response.content);
    stmt.bind(5, entry.response.model);
    if (entry.response.usage) {
        stmt.bind(6, static_cast<int64_t>(entry.response.usage->prompt_tokens));
        stmt.bind(7, static_cast<int64_t>(entry.response.usage->completion_tokens));
        stmt.bind(8, static_cast<int64_t>(entry.response.usage->total_tokens));
    } else {
        stmt.bindNull(6);
        stmt.bindNull(7);
        stmt.bindNull(8);
    }
    stmt.bind(9, entry.timestamp);
    stmt.bind(10, static_cast<int64_t>(entry.access_count));
    stmt.bind(11, entry.last_access);
    stmt.step();
}

void CacheStore::touch(uint64_t input_hash, int64_t now) {
    Statement stmt(m_db,
        "UPDATE response_cache SET access_count = access_count + 1, last_access = ? "
        "WHERE input_hash = ?");
    stmt.bind(1, now);
    stmt.bind(2, toStoredHash(input_hash));
    stmt.step();
}

bool CacheStore::erase(uint64_t input_hash) {
    Statement stmt(m_db, "DELETE FROM response_cache WHERE input_hash = ?");
    stmt.bind(1, toStoredHash(input_hash));
    stmt.step();
    return sqlite3_changes(m_db) > 0;
}

size_t CacheStore::deleteOlderThan(int64_t cutoff) {
    Statement stmt(m_db, "DELETE FROM response_cache WHERE timestamp < ?");
    stmt.bind(1, cutoff);
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(m_db));
}

size_t CacheStore::trimToSize(size_t max_entries) {
    Statement stmt(m_db,
        "DELETE FROM response_cache WHERE id NOT IN "
        "(SELECT id FROM response_cache ORDER BY timestamp DESC, id DESC LIMIT ?)");
    stmt.bind(1, static_cast<int64_t>(max_entries));
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(m_db));
}

size_t CacheStore::deleteModel(const std::string& model) {
    Statement stmt(m_db, "DELETE FROM response_cache WHERE model = ?");
    stmt.bind(1, model);
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(m_db));
}

size_t CacheStore::count() {
    Statement stmt(m_db, "SELECT COUNT(*) FROM response_cache");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.columnInt(0));
}

void CacheStore::clear() {
    execute("DELETE FROM response_cache");
}

} // namespace Zeke
