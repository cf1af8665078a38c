#pragma once

#include "Database.h"
#include <memory>
#include <optional>
#include <string>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// Settings: постоянные настройки приложения (таблица settings)
// ═══════════════════════════════════════════════════════════

class Settings {
public:
    explicit Settings(std::shared_ptr<Database> db);
    ~Settings();

    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);
    bool remove(const std::string& key);

    // ═══════════════════════════════════════════════════════════
    // Адрес удалённого backend
    // ═══════════════════════════════════════════════════════════

    /// Сохранённый URL backend или пустая строка
    std::string backendUrl() const;

    /// Проверить, нормализовать и сохранить URL backend
    /// @return Нормализованный URL
    /// @throws QueryError если URL некорректен
    std::string setBackendUrl(const std::string& url);

    /// Нормализация: trim, только https, непустой host, без query и fragment
    /// @return nullopt если URL некорректен
    static std::optional<std::string> normalizeBackendUrl(const std::string& url);

    static constexpr const char* KEY_BACKEND_URL = "localsync.backend_url";

private:
    std::shared_ptr<Database> m_db;
};

} // namespace LocalSync
