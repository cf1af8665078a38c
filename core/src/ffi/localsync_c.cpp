// localsync_c.cpp — реализация C API: общие функции, хранилище, кэш, очередь

#include "ffi_internal.h"
#include "localsync/localsync_c.h"
#include "localsync/core.h"
#include "localsync/Errors.h"
#include "localsync/LocalStore.h"
#include "localsync/Models.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;
using namespace LocalSync;

// ═══════════════════════════════════════════════════════════
// Thread-local error state for proper C API error handling
// ═══════════════════════════════════════════════════════════

// Thread-local error state (shared across ffi_*.cpp files)
thread_local LSError g_lastError = LS_OK;
thread_local std::string g_lastErrorMessage;

// Non-static so other ffi_*.cpp files can call these
void setLastError(LSError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != LS_OK && error != LS_ERROR_TRANSFER_CANCELLED) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

static LSError errorCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::StoreInit: return LS_ERROR_STORE_INIT;
        case ErrorKind::Query: return LS_ERROR_QUERY;
        case ErrorKind::Serialization: return LS_ERROR_SERIALIZATION;
        case ErrorKind::TransferCancelled: return LS_ERROR_TRANSFER_CANCELLED;
        case ErrorKind::TransferFailed: return LS_ERROR_TRANSFER_FAILED;
    }
    return LS_ERROR_INTERNAL;
}

LSError setLastErrorFrom(const std::exception& e) {
    LSError code = LS_ERROR_INTERNAL;
    if (auto* error = dynamic_cast<const Error*>(&e)) {
        code = errorCodeFor(error->kind());
    } else if (dynamic_cast<const std::invalid_argument*>(&e)) {
        code = LS_ERROR_INVALID_ARGUMENT;
    }
    setLastError(code, e.what());
    return code;
}

// ═══════════════════════════════════════════════════════════
// Хелперы
// ═══════════════════════════════════════════════════════════

char* alloc_string(const std::string& str) {
    return ls_strdup(str.c_str());
}

json parseJsonArg(const char* text, const json& fallback) {
    if (!text) {
        return fallback;
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw SerializationError(std::string("Invalid JSON argument: ") + e.what());
    }
}

static bool requireStore(LSStore store) {
    if (!store) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, "Null store handle");
        return false;
    }
    return true;
}

static bool requireString(const char* value, const char* name) {
    if (!value) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, std::string("Null ") + name);
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

const char* ls_version(void) {
    return LocalSync::VERSION;
}

const char* ls_error_message(LSError error) {
    switch (error) {
        case LS_OK: return "Success";
        case LS_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case LS_ERROR_STORE_INIT: return "Store initialization failed";
        case LS_ERROR_QUERY: return "Query error";
        case LS_ERROR_SERIALIZATION: return "Serialization error";
        case LS_ERROR_TRANSFER_CANCELLED: return "Transfer cancelled";
        case LS_ERROR_TRANSFER_FAILED: return "Transfer failed";
        case LS_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

LSError ls_last_error(void) {
    return g_lastError;
}

const char* ls_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

void ls_clear_error(void) {
    g_lastError = LS_OK;
    g_lastErrorMessage.clear();
}

void ls_free_string(char* str) {
    std::free(str);
}

// ═══════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════

LSError ls_set_log_level(int32_t level) {
    if (level < static_cast<int32_t>(spdlog::level::trace) ||
        level > static_cast<int32_t>(spdlog::level::off)) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, "Log level out of range: " + std::to_string(level));
        return LS_ERROR_INVALID_ARGUMENT;
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    setLastError(LS_OK);
    return LS_OK;
}

LSError ls_set_log_file(const char* path) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (path) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false));
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        auto previousLevel = spdlog::default_logger()->level();
        auto logger = std::make_shared<spdlog::logger>("localsync", sinks.begin(), sinks.end());
        logger->set_level(previousLevel);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);

        setLastError(LS_OK);
        return LS_OK;
    } catch (const spdlog::spdlog_ex& e) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, std::string("Cannot open log file: ") + e.what());
        return LS_ERROR_INVALID_ARGUMENT;
    }
}

// ═══════════════════════════════════════════════════════════
// Store
// ═══════════════════════════════════════════════════════════

LSStore ls_store_open(const char* data_dir, LSError* out_error) {
    try {
        StoreConfig config;
        if (data_dir) {
            config.dataDir = std::string(data_dir);
        }

        auto wrapper = std::make_unique<StoreWrapper>();
        wrapper->store = LocalStore::setup(config);

        setLastError(LS_OK);
        if (out_error) *out_error = LS_OK;
        return reinterpret_cast<LSStore>(wrapper.release());
    } catch (const std::exception& e) {
        LSError code = setLastErrorFrom(e);
        if (code != LS_ERROR_INVALID_ARGUMENT) {
            code = LS_ERROR_STORE_INIT;
            g_lastError = code;
        }
        if (out_error) *out_error = code;
        return nullptr;
    }
}

LSError ls_store_close(LSStore store) {
    if (!requireStore(store)) {
        return LS_ERROR_INVALID_ARGUMENT;
    }

    auto* wrapper = toStore(store);
    {
        // Не закрываем посреди прохода по очереди
        std::lock_guard<std::mutex> lock(wrapper->flushMutex);
    }
    delete wrapper;
    setLastError(LS_OK);
    return LS_OK;
}

// ═══════════════════════════════════════════════════════════
// Cache
// ═══════════════════════════════════════════════════════════

char* ls_cache_get(LSStore store, const char* key) {
    if (!requireStore(store) || !requireString(key, "cache key")) {
        return nullptr;
    }

    try {
        auto entry = toStore(store)->store->cache().get(key);
        setLastError(LS_OK);
        if (!entry) {
            return alloc_string("");  // Empty string indicates "not found" (not an error)
        }
        return alloc_string(toJson(*entry).dump());
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return nullptr;
    }
}

LSError ls_cache_set(LSStore store, const char* key, const char* value_json) {
    if (!requireStore(store) || !requireString(key, "cache key")) {
        return LS_ERROR_INVALID_ARGUMENT;
    }

    try {
        toStore(store)->store->cache().set(key, parseJsonArg(value_json, json(nullptr)));
        setLastError(LS_OK);
        return LS_OK;
    } catch (const std::exception& e) {
        return setLastErrorFrom(e);
    }
}

LSError ls_cache_delete(LSStore store, const char* key) {
    if (!requireStore(store) || !requireString(key, "cache key")) {
        return LS_ERROR_INVALID_ARGUMENT;
    }

    try {
        toStore(store)->store->cache().remove(key);
        setLastError(LS_OK);
        return LS_OK;
    } catch (const std::exception& e) {
        return setLastErrorFrom(e);
    }
}

int64_t ls_cache_delete_prefix(LSStore store, const char* prefix) {
    if (!requireStore(store) || !requireString(prefix, "cache prefix")) {
        return -1;
    }

    try {
        int64_t removed = toStore(store)->store->cache().removePrefix(prefix);
        setLastError(LS_OK);
        return removed;
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return -1;
    }
}

// ═══════════════════════════════════════════════════════════
// Sync Queue
// ═══════════════════════════════════════════════════════════

int64_t ls_queue_add(LSStore store, const char* action, const char* payload_json,
                     const char* method, const char* params_json) {
    if (!requireStore(store) || !requireString(action, "action")) {
        return -1;
    }

    try {
        int64_t id = toStore(store)->store->queue().add(
            action,
            parseJsonArg(payload_json, json(nullptr)),
            method ? method : DEFAULT_SYNC_METHOD,
            parseJsonArg(params_json, json::object()));
        setLastError(LS_OK);
        return id;
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return -1;
    }
}

char* ls_queue_list(LSStore store, int32_t limit) {
    if (!requireStore(store)) {
        return nullptr;
    }

    try {
        auto jobs = toStore(store)->store->queue().list(limit > 0 ? limit : DEFAULT_QUEUE_LIST_LIMIT);
        json arr = json::array();
        for (const auto& job : jobs) {
            arr.push_back(toJson(job));
        }
        setLastError(LS_OK);
        return alloc_string(arr.dump());
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return nullptr;
    }
}

LSError ls_queue_delete(LSStore store, int64_t id) {
    if (!requireStore(store)) {
        return LS_ERROR_INVALID_ARGUMENT;
    }

    try {
        toStore(store)->store->queue().remove(id);
        setLastError(LS_OK);
        return LS_OK;
    } catch (const std::exception& e) {
        return setLastErrorFrom(e);
    }
}

int64_t ls_queue_clear(LSStore store) {
    if (!requireStore(store)) {
        return -1;
    }

    try {
        int64_t removed = toStore(store)->store->queue().clear();
        setLastError(LS_OK);
        return removed;
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return -1;
    }
}

int64_t ls_queue_count(LSStore store) {
    if (!requireStore(store)) {
        return -1;
    }

    try {
        int64_t count = toStore(store)->store->queue().count();
        setLastError(LS_OK);
        return count;
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return -1;
    }
}

// ═══════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════

char* ls_settings_get_backend_url(LSStore store) {
    if (!requireStore(store)) {
        return nullptr;
    }

    try {
        auto url = toStore(store)->store->settings().backendUrl();
        setLastError(LS_OK);
        return alloc_string(url);
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return nullptr;
    }
}

LSError ls_settings_set_backend_url(LSStore store, const char* url) {
    if (!requireStore(store) || !requireString(url, "backend URL")) {
        return LS_ERROR_INVALID_ARGUMENT;
    }

    try {
        toStore(store)->store->settings().setBackendUrl(url);
        setLastError(LS_OK);
        return LS_OK;
    } catch (const std::exception& e) {
        return setLastErrorFrom(e);
    }
}
