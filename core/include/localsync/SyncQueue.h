#pragma once

#include "Database.h"
#include "Models.h"
#include <memory>
#include <string>
#include <vector>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// SyncQueue: надёжная исходящая очередь (outbox)
// ═══════════════════════════════════════════════════════════

/// Задание остаётся в очереди, пока его явно не удалят (at-least-once).
/// Политика повторов, подавление дублей и backoff: забота внешнего цикла.
class SyncQueue {
public:
    explicit SyncQueue(std::shared_ptr<Database> db);
    ~SyncQueue();

    /// Поставить задание в очередь
    /// @return id задания; возвращается только после записи в БД
    int64_t add(const std::string& action,
                const nlohmann::json& payload,
                const std::string& method = DEFAULT_SYNC_METHOD,
                const nlohmann::json& params = nlohmann::json::object());

    /// Задания по возрастанию id (старые первыми). Не удаляет задания.
    /// @throws MalformedSyncJobError если params или payload записи не разбираются;
    ///         jobId() указывает на запись, которую можно удалить через remove()
    std::vector<SyncJob> list(int limit = DEFAULT_QUEUE_LIST_LIMIT) const;

    /// Удалить задание (после подтверждённой отправки)
    /// @return true если задание было в очереди
    bool remove(int64_t id);

    /// Удалить все задания (например, при выходе из аккаунта)
    /// @return Количество удалённых заданий
    int64_t clear();

    /// Количество ожидающих заданий
    int64_t count() const;

private:
    std::shared_ptr<Database> m_db;
};

} // namespace LocalSync
