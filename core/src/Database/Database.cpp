#include "localsync/Database.h"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace LocalSync {

namespace {

constexpr const char* MEMORY_DB_PATH = ":memory:";

// Прагмы применяются при каждом открытии, до миграций
constexpr const char* CONNECTION_PRAGMAS[] = {
    "PRAGMA journal_mode = WAL",
    "PRAGMA synchronous = NORMAL",
    "PRAGMA temp_store = MEMORY",
    "PRAGMA busy_timeout = 5000",
};

void ensureParentDirectory(const std::string& dbPath) {
    if (dbPath.empty() || dbPath == MEMORY_DB_PATH) {
        return;
    }
    fs::path parent = fs::path(dbPath).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw StoreInitError("Failed to create database directory " + parent.string() +
                             ": " + ec.message());
    }
}

} // namespace

Database::Database(const std::string& dbPath) : m_dbPath(dbPath) {
    if (dbPath.empty()) {
        throw StoreInitError("Database path is empty");
    }
    ensureParentDirectory(dbPath);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db, flags, nullptr);

    if (rc != SQLITE_OK) {
        std::string error = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StoreInitError("Failed to open database " + dbPath + ": " + error);
    }

    for (const char* pragma : CONNECTION_PRAGMAS) {
        try {
            exec(pragma);
        } catch (const QueryError& e) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw StoreInitError(std::string("Failed to configure database: ") + e.what());
        }
    }

    spdlog::info("Database opened: {}", dbPath);
}

Database::~Database() {
    if (m_db) {
        sqlite3_close(m_db);
        spdlog::debug("Database closed: {}", m_dbPath);
    }
}

void Database::initialize() {
    try {
        guarded([this]() { applyMigrations(); });
    } catch (const StoreInitError&) {
        throw;
    } catch (const Error& e) {
        throw StoreInitError(std::string("Failed to initialize schema: ") + e.what());
    }
}

void Database::executeScript(const std::string& sql) {
    guarded([&]() { exec(sql); });
}

bool Database::isPoisoned() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_poisoned;
}

void Database::poison(const char* reason) {
    m_poisoned = true;
    spdlog::error("Database {} poisoned: {}", m_dbPath, reason);
}

void Database::exec(const std::string& sql) {
    char* errorMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errorMsg);

    if (rc != SQLITE_OK) {
        std::string error = errorMsg ? errorMsg : sqlite3_errstr(rc);
        sqlite3_free(errorMsg);
        throw QueryError("SQL execution failed: " + error + "\nSQL: " + sql);
    }
}

Database::Statement Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        throw QueryError("Failed to prepare statement: " +
                         std::string(sqlite3_errmsg(m_db)) + "\nSQL: " + sql);
    }
    return Statement(stmt);
}

void Database::step(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw QueryError("Failed to execute statement: " +
                         std::string(sqlite3_errmsg(m_db)));
    }
}

bool Database::stepRow(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    } else if (rc == SQLITE_DONE) {
        return false;
    }
    throw QueryError("Failed to step statement: " +
                     std::string(sqlite3_errmsg(m_db)));
}

// Привязка параметров
void Database::checkBind(int rc, int index) {
    if (rc != SQLITE_OK) {
        throw QueryError("Failed to bind parameter " + std::to_string(index) + ": " +
                         std::string(sqlite3_errmsg(m_db)));
    }
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, int value) {
    checkBind(sqlite3_bind_int(stmt, index, value), index);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, int64_t value) {
    checkBind(sqlite3_bind_int64(stmt, index, value), index);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, double value) {
    checkBind(sqlite3_bind_double(stmt, index, value), index);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const std::string& value) {
    checkBind(sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT),
              index);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const char* value) {
    if (value) {
        checkBind(sqlite3_bind_text(stmt, index, value, -1, SQLITE_TRANSIENT), index);
    } else {
        checkBind(sqlite3_bind_null(stmt, index), index);
    }
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, std::nullptr_t) {
    checkBind(sqlite3_bind_null(stmt, index), index);
}

// Хелперы для чтения
int Database::getInt(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int(stmt, col);
}

int64_t Database::getInt64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

double Database::getDouble(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_double(stmt, col);
}

std::string Database::getString(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (text) {
        int size = sqlite3_column_bytes(stmt, col);
        return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
    }
    return "";
}

std::optional<std::string> Database::getStringOpt(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return getString(stmt, col);
}

bool Database::isNull(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

} // namespace LocalSync
