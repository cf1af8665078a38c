// Config.h — параметры хранилища, загрузчика и прохода по очереди

#pragma once

#include "core.h"
#include "Models.h"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// Хранилище
// ═══════════════════════════════════════════════════════════

struct StoreConfig {
    std::string appName = DEFAULT_APP_NAME;
    std::optional<std::string> dataDir;     // nullopt = платформенная директория приложения
    std::string fileName = DEFAULT_DB_FILE_NAME;
};

// ═══════════════════════════════════════════════════════════
// Загрузка
// ═══════════════════════════════════════════════════════════

constexpr size_t DEFAULT_PROGRESS_EMIT_EVERY = 64 * 1024;   // 64 KB
constexpr long DEFAULT_CONNECT_TIMEOUT_SEC = 30;

struct UploadOptions {
    size_t progressEmitEvery = DEFAULT_PROGRESS_EMIT_EVERY;
    long connectTimeoutSec = DEFAULT_CONNECT_TIMEOUT_SEC;
    long timeoutSec = 0;                    // 0 = без общего таймаута
    std::string userAgent = std::string("LocalSync/") + VERSION;
};

// ═══════════════════════════════════════════════════════════
// Проход по очереди
// ═══════════════════════════════════════════════════════════

struct FlushOptions {
    int batchLimit = DEFAULT_QUEUE_LIST_LIMIT;

    /// write action -> read actions, кэш которых сбрасывается после успешной записи
    std::map<std::string, std::vector<std::string>> invalidations;
};

} // namespace LocalSync
