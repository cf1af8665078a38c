#pragma once

#include "Database.h"
#include "Models.h"
#include <memory>
#include <optional>
#include <string>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// CacheTable: ключ → непрозрачное значение с меткой времени
// ═══════════════════════════════════════════════════════════

class CacheTable {
public:
    explicit CacheTable(std::shared_ptr<Database> db);
    ~CacheTable();

    /// Получить запись
    /// @return nullopt если ключа нет
    /// @throws SerializationError если сохранённое значение повреждено
    std::optional<CacheEntry> get(const std::string& key) const;

    /// Записать значение (upsert). updated_at всегда = "сейчас"
    /// @throws SerializationError если значение не сериализуется
    CacheEntry set(const std::string& key, const nlohmann::json& value);

    /// Удалить ключ (no-op если его нет)
    /// @return true если запись была удалена
    bool remove(const std::string& key);

    /// Удалить все ключи с данным префиксом (точное побайтовое совпадение)
    /// Пустой префикс очищает весь кэш
    /// @return Количество удалённых записей
    int64_t removePrefix(const std::string& prefix);

    /// Количество записей
    int64_t count() const;

private:
    std::shared_ptr<Database> m_db;

    static void requireKey(const std::string& key);
};

} // namespace LocalSync
