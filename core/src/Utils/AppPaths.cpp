#include "localsync/AppPaths.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace LocalSync {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string tempFallback(const std::string& appName) {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return (tmp / appName).string();
}

} // namespace

std::string resolveAppDataDir(const std::string& appName) {
    std::string overrideDir = envOrEmpty(DATA_DIR_ENV);
    if (!overrideDir.empty()) {
        return overrideDir;
    }

#if defined(_WIN32)
    std::string appData = envOrEmpty("APPDATA");
    if (!appData.empty()) {
        return (fs::path(appData) / appName).string();
    }
#elif defined(__APPLE__)
    std::string home = envOrEmpty("HOME");
    if (!home.empty()) {
        return (fs::path(home) / "Library" / "Application Support" / appName).string();
    }
#else
    std::string xdgData = envOrEmpty("XDG_DATA_HOME");
    if (!xdgData.empty()) {
        return (fs::path(xdgData) / appName).string();
    }
    std::string home = envOrEmpty("HOME");
    if (!home.empty()) {
        return (fs::path(home) / ".local" / "share" / appName).string();
    }
#endif

    spdlog::warn("AppPaths: no user data directory, falling back to temp for {}", appName);
    return tempFallback(appName);
}

std::string resolveDatabasePath(const StoreConfig& config) {
    std::string dir = config.dataDir && !config.dataDir->empty()
                          ? *config.dataDir
                          : resolveAppDataDir(config.appName);
    return (fs::path(dir) / config.fileName).string();
}

} // namespace LocalSync
