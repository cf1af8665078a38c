#include "localsync/Database.h"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <array>

namespace LocalSync {

struct Migration {
    int version;
    const char* description;
    const char* sql;
};

// ═══════════════════════════════════════════════════════════
// МИГРАЦИИ СХЕМЫ БД
// ═══════════════════════════════════════════════════════════

static const std::array MIGRATIONS = {
    Migration{1, "Initial schema", R"SQL(
-- Версионирование схемы
CREATE TABLE IF NOT EXISTS schema_version (
    version INTEGER PRIMARY KEY,
    applied_at INTEGER DEFAULT (strftime('%s', 'now')),
    description TEXT
);

-- Настройки приложения
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT
);

-- Кэш состояния приложения (last-write-wins по ключу)
CREATE TABLE IF NOT EXISTS local_cache (
    key TEXT PRIMARY KEY NOT NULL,
    value TEXT NOT NULL,
    updated_at INTEGER NOT NULL
);

-- Исходящая очередь действий для удалённого backend
-- AUTOINCREMENT: id никогда не переиспользуются, даже после clear()
CREATE TABLE IF NOT EXISTS sync_queue (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    action TEXT NOT NULL,
    method TEXT NOT NULL DEFAULT 'POST',
    params TEXT NOT NULL DEFAULT '{}',
    payload TEXT NOT NULL DEFAULT 'null',
    created_at INTEGER NOT NULL
);
    )SQL"}
};

// ═══════════════════════════════════════════════════════════
// Реализация миграций
// ═══════════════════════════════════════════════════════════

int Database::getCurrentVersion() {
    // Проверяем существование таблицы schema_version
    auto exists = [](sqlite3_stmt* stmt) { return getInt(stmt, 0); };
    auto result = runQueryOne<int>(
        "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='schema_version'",
        exists);

    if (!result || *result == 0) {
        return 0; // Таблицы нет: версия 0
    }

    auto maxVersion = [](sqlite3_stmt* stmt) {
        if (isNull(stmt, 0)) return 0;
        return getInt(stmt, 0);
    };
    auto version = runQueryOne<int>("SELECT MAX(version) FROM schema_version", maxVersion);

    return version.value_or(0);
}

void Database::applyMigrations() {
    int currentVersion = getCurrentVersion();
    spdlog::info("Database version: {}, latest: {}", currentVersion, MIGRATIONS.size());

    for (const auto& migration : MIGRATIONS) {
        if (migration.version <= currentVersion) {
            continue;
        }

        spdlog::info("Applying migration {}: {}", migration.version, migration.description);

        try {
            exec("BEGIN EXCLUSIVE TRANSACTION");
        } catch (const QueryError& e) {
            throw StoreInitError(std::string("Migration could not start: ") + e.what());
        }

        try {
            exec(migration.sql);

            // Записываем версию
            auto stmt = prepare("INSERT INTO schema_version (version, description) VALUES (?, ?)");
            int version = migration.version;
            const char* description = migration.description;
            bindAll(stmt.get(), 1, version, description);
            step(stmt.get());

            exec("COMMIT");
            spdlog::info("Migration {} completed", migration.version);

        } catch (const QueryError& e) {
            spdlog::error("Migration {} failed: {}", migration.version, e.what());
            try {
                exec("ROLLBACK");
            } catch (const QueryError& rollbackError) {
                spdlog::error("Migration {} rollback failed: {}", migration.version,
                              rollbackError.what());
            }
            throw StoreInitError("Migration " + std::to_string(migration.version) +
                                 " failed: " + e.what());
        }
    }

    spdlog::info("Database schema is up to date (version {})", MIGRATIONS.size());
}

} // namespace LocalSync
