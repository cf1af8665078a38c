// LocalStore.h — точка входа в локальное хранилище
// Владеет единственным файлом БД и всеми таблицами поверх него

#pragma once

#include "Config.h"
#include "Database.h"
#include "CacheTable.h"
#include "SyncQueue.h"
#include "Settings.h"
#include <memory>

namespace LocalSync {

class LocalStore {
public:
    /// Открыть/создать БД, применить прагмы и миграции
    /// @throws StoreInitError при любой ошибке; повторов нет
    static std::shared_ptr<LocalStore> setup(const StoreConfig& config = StoreConfig{});

    /// Открыть по явному пути к файлу
    /// @throws StoreInitError
    static std::shared_ptr<LocalStore> open(const std::string& dbPath);

    ~LocalStore();

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    CacheTable& cache() { return *m_cache; }
    SyncQueue& queue() { return *m_queue; }
    Settings& settings() { return *m_settings; }

    std::shared_ptr<CacheTable> cachePtr() const { return m_cache; }
    std::shared_ptr<SyncQueue> queuePtr() const { return m_queue; }
    std::shared_ptr<Database> database() const { return m_db; }

    const std::string& path() const { return m_db->path(); }

private:
    explicit LocalStore(std::shared_ptr<Database> db);

    std::shared_ptr<Database> m_db;
    std::shared_ptr<CacheTable> m_cache;
    std::shared_ptr<SyncQueue> m_queue;
    std::shared_ptr<Settings> m_settings;
};

} // namespace LocalSync
