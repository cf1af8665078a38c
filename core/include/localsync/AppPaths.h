#pragma once

#include "export.h"
#include "Config.h"
#include <string>

namespace LocalSync {

/// Переменная окружения, переопределяющая директорию данных
constexpr const char* DATA_DIR_ENV = "LOCALSYNC_DATA_DIR";

/// Платформенная директория данных приложения (не создаётся)
/// - LOCALSYNC_DATA_DIR, если задана
/// - Windows: %APPDATA%/<app>
/// - macOS: $HOME/Library/Application Support/<app>
/// - Linux: $XDG_DATA_HOME/<app> или $HOME/.local/share/<app>
/// - иначе: <temp>/<app>
LS_API std::string resolveAppDataDir(const std::string& appName);

/// Полный путь к файлу БД для конфигурации
LS_API std::string resolveDatabasePath(const StoreConfig& config);

} // namespace LocalSync
