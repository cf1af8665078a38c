#include "localsync/SyncQueue.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace LocalSync {

using json = nlohmann::json;

namespace {

constexpr const char* JOB_SELECT_SQL = R"SQL(
    SELECT id, action, method, params, payload, created_at
    FROM sync_queue
)SQL";

std::string encode(const json& value, const char* field, const std::string& action) {
    try {
        return value.dump();
    } catch (const json::type_error& e) {
        throw SerializationError("Cannot serialize " + std::string(field) + " of '" + action +
                                 "' job: " + e.what());
    }
}

json decode(const std::string& text, const char* field, int64_t id) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedSyncJobError(id, "Malformed " + std::string(field) + " in sync job " +
                                            std::to_string(id) + ": " + e.what());
    }
}

struct StoredJob {
    int64_t id = 0;
    std::string action;
    std::string method;
    std::string params;
    std::string payload;
    int64_t createdAt = 0;
};

StoredJob mapStoredJob(sqlite3_stmt* stmt) {
    StoredJob row;
    row.id = Database::getInt64(stmt, 0);
    row.action = Database::getString(stmt, 1);
    row.method = Database::getString(stmt, 2);
    row.params = Database::getString(stmt, 3);
    row.payload = Database::getString(stmt, 4);
    row.createdAt = Database::getInt64(stmt, 5);
    return row;
}

} // namespace

SyncQueue::SyncQueue(std::shared_ptr<Database> db)
    : m_db(std::move(db)) {
    if (!m_db) {
        throw std::invalid_argument("Database instance is required");
    }
}

SyncQueue::~SyncQueue() = default;

int64_t SyncQueue::add(const std::string& action,
                       const json& payload,
                       const std::string& method,
                       const json& params) {
    if (action.empty()) {
        throw QueryError("Sync job action is required");
    }
    if (method.empty()) {
        throw QueryError("Sync job method is required");
    }

    std::string encodedParams = encode(params.is_null() ? json::object() : params, "params", action);
    std::string encodedPayload = encode(payload, "payload", action);
    int64_t createdAt = nowMillis();

    int64_t id = m_db->insert(
        R"SQL(
        INSERT INTO sync_queue (action, method, params, payload, created_at)
        VALUES (?, ?, ?, ?, ?)
        )SQL",
        action,
        method,
        encodedParams,
        encodedPayload,
        createdAt);

    spdlog::info("SyncQueue: queued job {} ({} {})", id, method, action);
    return id;
}

std::vector<SyncJob> SyncQueue::list(int limit) const {
    if (limit <= 0) {
        throw QueryError("Sync queue list limit must be positive, got " + std::to_string(limit));
    }

    auto rows = m_db->query<StoredJob>(
        std::string(JOB_SELECT_SQL) + " ORDER BY id ASC LIMIT ?",
        mapStoredJob,
        limit);

    std::vector<SyncJob> jobs;
    jobs.reserve(rows.size());
    for (auto& row : rows) {
        SyncJob job;
        job.id = row.id;
        job.action = std::move(row.action);
        job.method = std::move(row.method);
        job.params = decode(row.params, "params", row.id);
        job.payload = decode(row.payload, "payload", row.id);
        job.createdAt = row.createdAt;
        jobs.push_back(std::move(job));
    }
    return jobs;
}

bool SyncQueue::remove(int64_t id) {
    bool removed = m_db->execute("DELETE FROM sync_queue WHERE id = ?", id) > 0;
    if (removed) {
        spdlog::info("SyncQueue: job {} removed", id);
    }
    return removed;
}

int64_t SyncQueue::clear() {
    int removed = m_db->execute("DELETE FROM sync_queue");
    spdlog::info("SyncQueue: cleared {} jobs", removed);
    return removed;
}

int64_t SyncQueue::count() const {
    return m_db->queryScalar("SELECT COUNT(*) FROM sync_queue");
}

} // namespace LocalSync
