// SyncFlusher.h — один проход по очереди синхронизации
// Доставка at-least-once: задание удаляется только после подтверждённого ответа

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../LocalStore.h"
#include "../Models.h"
#include "../Transfer/UploadService.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace LocalSync {

/// Детерминированный ключ кэша ответа: "<url>|<action>|k1=v1&k2=v2"
/// Параметры отсортированы по ключу, null пропускаются, значения percent-encoded.
LS_API std::string cacheKeyFor(
    const std::string& url,
    const std::string& action,
    const nlohmann::json& params = nlohmann::json::object());

/// Префикс всех ключей кэша для action: "<url>|<action>|"
LS_API std::string cacheKeyPrefix(const std::string& url, const std::string& action);

class LS_API SyncFlusher {
public:
    using StatusCallback = std::function<void(SyncStatus status)>;

    SyncFlusher(
        std::shared_ptr<LocalStore> store,
        std::shared_ptr<UploadService> uploader,
        FlushOptions options = FlushOptions{});

    ~SyncFlusher();

    SyncFlusher(const SyncFlusher&) = delete;
    SyncFlusher& operator=(const SyncFlusher&) = delete;

    /// Один проход без повторов:
    /// - параллельный вызов возвращает skipped = true;
    /// - пустой url оставляет очередь нетронутой (Pending);
    /// - задания отправляются от старых к новым, первая ошибка
    ///   останавливает проход, задание остаётся в очереди.
    /// Ошибки отправки не бросаются, а попадают в FlushResult::error.
    /// Повреждённая запись очереди останавливает проход до отправки:
    /// её id в FlushResult::failedJobId, статус Pending.
    /// Все задания отправляются POST-ом с телом {"action", "payload", "params"},
    /// сохранённый method не влияет на запрос.
    /// @throws QueryError при сбое хранилища
    FlushResult flush(const std::string& url);

    /// Сбросить кэш ответов read-действий, зависящих от writeAction
    /// @return число удалённых записей
    int64_t invalidateForWrite(const std::string& url, const std::string& writeAction);

    /// Вызывается при смене состояния (Syncing в начале, итог в конце)
    void setStatusCallback(StatusCallback callback);

    bool isRunning() const { return m_running.load(); }

private:
    void notifyStatus(SyncStatus status);
    nlohmann::json buildBody(const SyncJob& job) const;

    std::shared_ptr<LocalStore> m_store;
    std::shared_ptr<UploadService> m_uploader;
    FlushOptions m_options;
    std::mutex m_callbackMutex;
    StatusCallback m_onStatus;
    std::atomic<bool> m_running{false};
};

} // namespace LocalSync
