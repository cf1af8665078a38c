#include "localsync/Settings.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace LocalSync {

namespace {

std::string trim(const std::string& str) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(str.begin(), str.end(), notSpace);
    auto end = std::find_if(str.rbegin(), str.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

} // namespace

Settings::Settings(std::shared_ptr<Database> db)
    : m_db(std::move(db)) {
    if (!m_db) {
        throw std::invalid_argument("Database instance is required");
    }
}

Settings::~Settings() = default;

std::optional<std::string> Settings::get(const std::string& key) const {
    auto value = m_db->queryOne<std::optional<std::string>>(
        "SELECT value FROM settings WHERE key = ?",
        [](sqlite3_stmt* stmt) { return Database::getStringOpt(stmt, 0); },
        key);
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

void Settings::set(const std::string& key, const std::string& value) {
    if (key.empty()) {
        throw QueryError("Setting key is required");
    }
    m_db->execute(
        "INSERT INTO settings (key, value) VALUES (?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value",
        key,
        value);
}

bool Settings::remove(const std::string& key) {
    return m_db->execute("DELETE FROM settings WHERE key = ?", key) > 0;
}

std::string Settings::backendUrl() const {
    return get(KEY_BACKEND_URL).value_or("");
}

std::string Settings::setBackendUrl(const std::string& url) {
    auto normalized = normalizeBackendUrl(url);
    if (!normalized) {
        throw QueryError("Invalid backend URL (expected https://host/path): " + url);
    }
    set(KEY_BACKEND_URL, *normalized);
    spdlog::info("Settings: backend URL set to {}", *normalized);
    return *normalized;
}

std::optional<std::string> Settings::normalizeBackendUrl(const std::string& url) {
    std::string trimmed = trim(url);

    const std::string scheme = "https://";
    if (trimmed.size() <= scheme.size() || toLower(trimmed.substr(0, scheme.size())) != scheme) {
        return std::nullopt;
    }

    // Отрезаем query и fragment
    std::string rest = trimmed.substr(scheme.size());
    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) {
        rest = rest.substr(0, cut);
    }

    auto slash = rest.find('/');
    std::string host = toLower(rest.substr(0, slash));
    std::string path = slash == std::string::npos ? std::string() : rest.substr(slash);

    if (host.empty() || host.find_first_of(" \t@") != std::string::npos) {
        return std::nullopt;
    }
    if (path.find_first_of(" \t") != std::string::npos) {
        return std::nullopt;
    }

    return scheme + host + path;
}

} // namespace LocalSync
