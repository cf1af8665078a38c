// CancellationRegistry.h — флаги кооперативной отмены передач
// Живут только в памяти процесса, не сохраняются между запусками

#pragma once

#include "../export.h"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// CancellationFlag: устанавливается один раз, никогда не сбрасывается
// ═══════════════════════════════════════════════════════════

class LS_API CancellationFlag {
public:
    CancellationFlag() = default;

    CancellationFlag(const CancellationFlag&) = delete;
    CancellationFlag& operator=(const CancellationFlag&) = delete;

    void cancel() noexcept { m_cancelled.store(true, std::memory_order_seq_cst); }
    bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_seq_cst); }

private:
    std::atomic<bool> m_cancelled{false};
};

// ═══════════════════════════════════════════════════════════
// CancellationRegistry: upload id → флаг отмены
// ═══════════════════════════════════════════════════════════

/// Все изменения карты: под одним mutex; проверка флага на горячем пути
/// (каждый chunk) mutex не берёт.
class LS_API CancellationRegistry {
public:
    CancellationRegistry() = default;

    CancellationRegistry(const CancellationRegistry&) = delete;
    CancellationRegistry& operator=(const CancellationRegistry&) = delete;

    /// Создать новый флаг для id, заменив прежний (последняя регистрация побеждает)
    std::shared_ptr<CancellationFlag> registerUpload(const std::string& uploadId);

    /// Установить флаг, если он есть
    /// @return true если активный флаг найден
    bool cancel(const std::string& uploadId);

    /// Удалить запись. Вызывается ровно один раз на передачу при любом исходе.
    /// @return true если запись существовала
    bool remove(const std::string& uploadId);

    bool contains(const std::string& uploadId) const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<CancellationFlag>> m_flags;
};

} // namespace LocalSync
