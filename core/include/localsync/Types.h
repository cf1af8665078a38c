#pragma once

#include "export.h"
#include <cstdint>
#include <string>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// Состояние синхронизации очереди
// ═══════════════════════════════════════════════════════════

enum class SyncStatus : int32_t {
    Synced = 0,     // Очередь пуста
    Pending = 1,    // Есть неотправленные задания
    Syncing = 2     // Идёт отправка
};

LS_API const char* syncStatusToString(SyncStatus status);
LS_API SyncStatus syncStatusFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Время
// ═══════════════════════════════════════════════════════════

/// Unix-время в миллисекундах, не убывает в пределах процесса
LS_API int64_t nowMillis();

} // namespace LocalSync
