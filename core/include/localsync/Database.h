#pragma once

#include "Errors.h"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>

#include <sqlite3.h>

struct sqlite3;
struct sqlite3_stmt;

namespace LocalSync {

/// RAII обёртка над SQLite соединением.
///
/// Одно соединение, один писатель: каждая операция выполняется под единым
/// mutex, который держится ровно на время одного оператора. Непредвиденное
/// исключение под mutex "отравляет" соединение навсегда: все последующие
/// операции завершаются QueryError. Это ограничение масштабирования при
/// высокой конкуренции записи.
class Database {
public:
    /// Открыть или создать файл БД (родительские директории создаются)
    /// @throws StoreInitError
    explicit Database(const std::string& dbPath);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Инициализация БД: применяет миграции
    /// @throws StoreInitError
    void initialize();

    /// Выполнение набора SQL операторов без параметров
    void executeScript(const std::string& sql);

    /// Выполнение SQL с параметрами
    /// @return Количество изменённых строк
    template<typename... Args>
    int execute(const std::string& sql, Args&&... args) {
        return guarded([&]() {
            auto stmt = prepare(sql);
            bindAll(stmt.get(), 1, args...);
            step(stmt.get());
            return sqlite3_changes(m_db);
        });
    }

    /// INSERT с параметрами
    /// @return rowid вставленной записи (читается под тем же mutex)
    template<typename... Args>
    int64_t insert(const std::string& sql, Args&&... args) {
        return guarded([&]() {
            auto stmt = prepare(sql);
            bindAll(stmt.get(), 1, args...);
            step(stmt.get());
            return static_cast<int64_t>(sqlite3_last_insert_rowid(m_db));
        });
    }

    /// Запрос с маппером результатов
    template<typename T, typename Mapper, typename... Args>
    std::vector<T> query(const std::string& sql, Mapper mapper, Args&&... args) {
        return guarded([&]() { return runQuery<T>(sql, mapper, args...); });
    }

    /// Запрос одной записи
    template<typename T, typename Mapper, typename... Args>
    std::optional<T> queryOne(const std::string& sql, Mapper mapper, Args&&... args) {
        return guarded([&]() { return runQueryOne<T>(sql, mapper, args...); });
    }

    /// Запрос скалярного значения (int64)
    template<typename... Args>
    int64_t queryScalar(const std::string& sql, Args&&... args) {
        return guarded([&]() {
            auto stmt = prepare(sql);
            bindAll(stmt.get(), 1, args...);

            int64_t result = 0;
            if (stepRow(stmt.get())) {
                result = getInt64(stmt.get(), 0);
            }
            return result;
        });
    }

    const std::string& path() const { return m_dbPath; }

    /// Соединение отравлено предыдущим непредвиденным сбоем
    bool isPoisoned() const;

    /// Хелперы для чтения из stmt
    static int getInt(sqlite3_stmt* stmt, int col);
    static int64_t getInt64(sqlite3_stmt* stmt, int col);
    static double getDouble(sqlite3_stmt* stmt, int col);
    static std::string getString(sqlite3_stmt* stmt, int col);
    static std::optional<std::string> getStringOpt(sqlite3_stmt* stmt, int col);
    static bool isNull(sqlite3_stmt* stmt, int col);

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    sqlite3* m_db = nullptr;
    std::string m_dbPath;
    mutable std::mutex m_mutex;
    bool m_poisoned = false;

    // Выполнить fn под mutex; непредвиденное исключение отравляет соединение
    template<typename Fn>
    auto guarded(Fn&& fn) -> decltype(fn()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_poisoned) {
            throw QueryError("Store is poisoned by an earlier failure: " + m_dbPath);
        }
        try {
            return fn();
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            poison(e.what());
            throw QueryError(std::string("Unexpected failure inside store, store poisoned: ") + e.what());
        } catch (...) {
            poison("unknown exception");
            throw;
        }
    }

    void poison(const char* reason);

    // Миграции (вызываются под mutex)
    void applyMigrations();
    int getCurrentVersion();
    void exec(const std::string& sql);

    // Prepared statements
    Statement prepare(const std::string& sql);
    void step(sqlite3_stmt* stmt);
    bool stepRow(sqlite3_stmt* stmt);

    template<typename T, typename Mapper, typename... Args>
    std::vector<T> runQuery(const std::string& sql, Mapper& mapper, Args&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt.get(), 1, args...);

        std::vector<T> results;
        while (stepRow(stmt.get())) {
            results.push_back(mapper(stmt.get()));
        }
        return results;
    }

    template<typename T, typename Mapper, typename... Args>
    std::optional<T> runQueryOne(const std::string& sql, Mapper& mapper, Args&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt.get(), 1, args...);

        std::optional<T> result;
        if (stepRow(stmt.get())) {
            result = mapper(stmt.get());
        }
        return result;
    }

    // Привязка параметров
    void bindParameter(sqlite3_stmt* stmt, int index, int value);
    void bindParameter(sqlite3_stmt* stmt, int index, int64_t value);
    // Явная перегрузка для long long если int64_t != long long
    // (на Windows int64_t = long long, на Linux int64_t = long)
    template<typename T>
    std::enable_if_t<
        std::is_same_v<T, long long> && !std::is_same_v<int64_t, long long>,
        void
    > bindParameter(sqlite3_stmt* stmt, int index, T value) {
        bindParameter(stmt, index, static_cast<int64_t>(value));
    }
    void bindParameter(sqlite3_stmt* stmt, int index, double value);
    void bindParameter(sqlite3_stmt* stmt, int index, const std::string& value);
    void bindParameter(sqlite3_stmt* stmt, int index, const char* value);
    void bindParameter(sqlite3_stmt* stmt, int index, std::nullptr_t);
    void checkBind(int rc, int index);

    // Рекурсивная привязка всех параметров
    template<typename T, typename... Rest>
    void bindAll(sqlite3_stmt* stmt, int index, T& first, Rest&... rest) {
        bindParameter(stmt, index, first);
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, rest...);
        }
    }

    void bindAll(sqlite3_stmt*, int) {} // База рекурсии
};

} // namespace LocalSync
