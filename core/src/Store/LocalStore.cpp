#include "localsync/LocalStore.h"
#include "localsync/AppPaths.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace LocalSync {

std::shared_ptr<LocalStore> LocalStore::setup(const StoreConfig& config) {
    if (config.fileName.empty()) {
        throw StoreInitError("Database file name is empty");
    }
    return open(resolveDatabasePath(config));
}

std::shared_ptr<LocalStore> LocalStore::open(const std::string& dbPath) {
    auto db = std::make_shared<Database>(dbPath);
    db->initialize();

    spdlog::info("LocalStore ready: {}", dbPath);
    // Конструктор приватный: make_shared недоступен
    return std::shared_ptr<LocalStore>(new LocalStore(std::move(db)));
}

LocalStore::LocalStore(std::shared_ptr<Database> db)
    : m_db(std::move(db))
    , m_cache(std::make_shared<CacheTable>(m_db))
    , m_queue(std::make_shared<SyncQueue>(m_db))
    , m_settings(std::make_shared<Settings>(m_db)) {}

LocalStore::~LocalStore() = default;

} // namespace LocalSync
