// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef LOCALSYNC_FFI_INTERNAL_H
#define LOCALSYNC_FFI_INTERNAL_H

#include "localsync/localsync_c.h"
#include "localsync/Config.h"
#include "localsync/LocalStore.h"
#include "localsync/Transfer/ProgressChannel.h"
#include "localsync/Transfer/UploadService.h"
#include <nlohmann/json.hpp>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <cstring>

#ifdef _WIN32
    #define ls_strdup _strdup
#else
    #define ls_strdup strdup
#endif

// Thread-local error state
extern thread_local LSError g_lastError;
extern thread_local std::string g_lastErrorMessage;

// Error handling functions (defined in localsync_c.cpp)
// Note: default argument only in declaration, not in definition
void setLastError(LSError error, const std::string& message = "");
inline void clearLastError() { setLastError(LS_OK); }

/// Записать код и сообщение по исключению (LocalSync::Error -> его kind)
/// @return записанный код
LSError setLastErrorFrom(const std::exception& e);

// String allocation (defined in localsync_c.cpp)
char* alloc_string(const std::string& str);

/// Разобрать JSON аргумент; nullptr -> fallback
/// @throws LocalSync::SerializationError если строка не JSON
nlohmann::json parseJsonArg(const char* text, const nlohmann::json& fallback);

// ═══════════════════════════════════════════════════════════
// Handle wrappers
// ═══════════════════════════════════════════════════════════

struct StoreWrapper {
    std::shared_ptr<LocalSync::LocalStore> store;

    // Проход по очереди: один за раз на хранилище
    std::mutex flushMutex;
    std::mutex optionsMutex;
    LocalSync::FlushOptions flushOptions;
};

struct UploaderWrapper {
    std::shared_ptr<LocalSync::ProgressChannel> channel;
    std::shared_ptr<LocalSync::UploadService> service;

    ~UploaderWrapper() {
        // Сначала сервис (держит sink), затем канал дожидается доставки
        service.reset();
        channel.reset();
    }
};

inline StoreWrapper* toStore(LSStore handle) {
    return reinterpret_cast<StoreWrapper*>(handle);
}

inline UploaderWrapper* toUploader(LSUploader handle) {
    return reinterpret_cast<UploaderWrapper*>(handle);
}

#endif // LOCALSYNC_FFI_INTERNAL_H
