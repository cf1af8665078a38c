#pragma once

#include "Types.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// Запись кэша
// ═══════════════════════════════════════════════════════════

struct CacheEntry {
    std::string key;
    nlohmann::json value;       // Непрозрачное значение, хранилище его не разбирает
    int64_t updatedAt = 0;      // Unix ms последней записи
};

// ═══════════════════════════════════════════════════════════
// Задание очереди синхронизации
// ═══════════════════════════════════════════════════════════

constexpr const char* DEFAULT_SYNC_METHOD = "POST";
constexpr int DEFAULT_QUEUE_LIST_LIMIT = 200;

struct SyncJob {
    int64_t id = 0;                 // Строго возрастает, не переиспользуется
    std::string action;
    std::string method = DEFAULT_SYNC_METHOD;
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json payload;
    int64_t createdAt = 0;          // Unix ms постановки в очередь
};

// ═══════════════════════════════════════════════════════════
// Прогресс загрузки (не хранится)
// ═══════════════════════════════════════════════════════════

struct UploadProgress {
    std::string uploadId;
    uint64_t loaded = 0;
    uint64_t total = 0;
    bool done = false;
};

// ═══════════════════════════════════════════════════════════
// Результат прохода по очереди
// ═══════════════════════════════════════════════════════════

struct FlushResult {
    SyncStatus status = SyncStatus::Synced;
    int64_t sent = 0;           // Успешно отправлено и удалено
    int64_t remaining = 0;      // Осталось в очереди после прохода
    bool skipped = false;       // Другой проход уже выполнялся
    std::string error;          // Ошибка, остановившая проход
    int64_t failedJobId = 0;    // Задание, на котором проход остановился (0 = нет)
};

// ═══════════════════════════════════════════════════════════
// Вариант кодирования изображения
// ═══════════════════════════════════════════════════════════

struct EncodedImage {
    std::string mimeType;
    std::vector<uint8_t> bytes;
    uint32_t width = 0;
    uint32_t height = 0;
};

// ═══════════════════════════════════════════════════════════
// JSON представления (контракт с UI)
// ═══════════════════════════════════════════════════════════

LS_API nlohmann::json toJson(const CacheEntry& entry);
LS_API nlohmann::json toJson(const SyncJob& job);
LS_API nlohmann::json toJson(const UploadProgress& progress);
LS_API nlohmann::json toJson(const FlushResult& result);

} // namespace LocalSync
