#include "localsync/CacheTable.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace LocalSync {

using json = nlohmann::json;

namespace {

struct StoredRow {
    std::string key;
    std::string value;
    int64_t updatedAt = 0;
};

StoredRow mapRow(sqlite3_stmt* stmt) {
    StoredRow row;
    row.key = Database::getString(stmt, 0);
    row.value = Database::getString(stmt, 1);
    row.updatedAt = Database::getInt64(stmt, 2);
    return row;
}

} // namespace

CacheTable::CacheTable(std::shared_ptr<Database> db)
    : m_db(std::move(db)) {
    if (!m_db) {
        throw std::invalid_argument("Database instance is required");
    }
}

CacheTable::~CacheTable() = default;

void CacheTable::requireKey(const std::string& key) {
    if (key.empty()) {
        throw QueryError("Cache key is required");
    }
}

std::optional<CacheEntry> CacheTable::get(const std::string& key) const {
    requireKey(key);

    auto row = m_db->queryOne<StoredRow>(
        "SELECT key, value, updated_at FROM local_cache WHERE key = ?",
        mapRow,
        key);

    if (!row) {
        return std::nullopt;
    }

    // Decode outside the store guard
    CacheEntry entry;
    entry.key = std::move(row->key);
    entry.updatedAt = row->updatedAt;
    try {
        entry.value = json::parse(row->value);
    } catch (const json::parse_error& e) {
        spdlog::error("CacheTable: malformed value for key '{}': {}", key, e.what());
        throw SerializationError("Malformed cached value for key '" + key + "': " + e.what());
    }
    return entry;
}

CacheEntry CacheTable::set(const std::string& key, const json& value) {
    requireKey(key);

    std::string encoded;
    try {
        encoded = value.dump();
    } catch (const json::type_error& e) {
        throw SerializationError("Cannot serialize value for key '" + key + "': " + e.what());
    }

    CacheEntry entry{key, value, nowMillis()};
    m_db->execute(
        R"SQL(
        INSERT INTO local_cache (key, value, updated_at)
        VALUES (?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET
            value = excluded.value,
            updated_at = excluded.updated_at
        )SQL",
        key,
        encoded,
        entry.updatedAt);

    spdlog::debug("CacheTable: set '{}' ({} bytes)", key, encoded.size());
    return entry;
}

bool CacheTable::remove(const std::string& key) {
    requireKey(key);
    return m_db->execute("DELETE FROM local_cache WHERE key = ?", key) > 0;
}

int64_t CacheTable::removePrefix(const std::string& prefix) {
    // substr() instead of LIKE: '%' and '_' in keys must not act as wildcards
    int removed = m_db->execute(
        "DELETE FROM local_cache WHERE substr(key, 1, length(?1)) = ?1",
        prefix);

    spdlog::debug("CacheTable: removed {} entries with prefix '{}'", removed, prefix);
    return removed;
}

int64_t CacheTable::count() const {
    return m_db->queryScalar("SELECT COUNT(*) FROM local_cache");
}

} // namespace LocalSync
