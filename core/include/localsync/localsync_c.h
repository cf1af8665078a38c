// localsync_c.h — C API для встраивающего приложения
// Все структурированные значения передаются как JSON строки

#ifndef LOCALSYNC_C_H
#define LOCALSYNC_C_H

#include "export.h"
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct LSStore_* LSStore;
typedef struct LSUploader_* LSUploader;

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

typedef enum {
    LS_OK = 0,
    LS_ERROR_INVALID_ARGUMENT = 1,
    LS_ERROR_STORE_INIT = 2,
    LS_ERROR_QUERY = 3,
    LS_ERROR_SERIALIZATION = 4,
    LS_ERROR_TRANSFER_CANCELLED = 5,
    LS_ERROR_TRANSFER_FAILED = 6,
    LS_ERROR_INTERNAL = 99
} LSError;

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

/// Возвращает версию библиотеки
LS_API const char* ls_version(void);

/// Возвращает текстовое описание ошибки
LS_API const char* ls_error_message(LSError error);

/// Получить последнюю ошибку (thread-local)
LS_API LSError ls_last_error(void);

/// Получить сообщение последней ошибки (thread-local)
LS_API const char* ls_last_error_message(void);

/// Очистить состояние ошибки
LS_API void ls_clear_error(void);

/// Освобождает строку, выделенную библиотекой
LS_API void ls_free_string(char* str);

/// Уровень логирования: 0=trace, 1=debug, 2=info, 3=warn, 4=error, 5=critical, 6=off
LS_API LSError ls_set_log_level(int32_t level);

/// Писать лог в файл (дозапись). NULL: вернуть вывод в консоль.
LS_API LSError ls_set_log_file(const char* path);

// ═══════════════════════════════════════════════════════════
// Store
// ═══════════════════════════════════════════════════════════

/// Открыть/создать локальное хранилище
/// @param data_dir директория данных; NULL: платформенная директория приложения
/// @return handle или NULL (out_error = LS_ERROR_STORE_INIT)
LS_API LSStore ls_store_open(const char* data_dir, LSError* out_error);

/// Закрыть хранилище
LS_API LSError ls_store_close(LSStore store);

// ═══════════════════════════════════════════════════════════
// Cache
// ═══════════════════════════════════════════════════════════

/// Получить запись кэша (JSON {key, value, updatedAt})
/// @return JSON строка, пустая строка если ключа нет, NULL при ошибке
LS_API char* ls_cache_get(LSStore store, const char* key);

/// Записать значение (value_json: любой JSON)
LS_API LSError ls_cache_set(LSStore store, const char* key, const char* value_json);

/// Удалить ключ (no-op если его нет)
LS_API LSError ls_cache_delete(LSStore store, const char* key);

/// Удалить все ключи с префиксом
/// @return число удалённых записей или -1 при ошибке
LS_API int64_t ls_cache_delete_prefix(LSStore store, const char* prefix);

// ═══════════════════════════════════════════════════════════
// Sync Queue
// ═══════════════════════════════════════════════════════════

/// Поставить задание в очередь
/// @param payload_json JSON; NULL: null
/// @param method NULL: "POST"
/// @param params_json JSON объект; NULL: {}
/// @return id задания или -1 при ошибке
LS_API int64_t ls_queue_add(LSStore store, const char* action, const char* payload_json,
                            const char* method, const char* params_json);

/// Список заданий (JSON array), старые первыми
/// @param limit <= 0: значение по умолчанию (200)
/// @return NULL при ошибке; повреждённая запись даёт LS_ERROR_SERIALIZATION,
///         сообщение содержит её id ("sync job <id>")
LS_API char* ls_queue_list(LSStore store, int32_t limit);

/// Удалить задание по id
LS_API LSError ls_queue_delete(LSStore store, int64_t id);

/// Удалить все задания
/// @return число удалённых заданий или -1 при ошибке
LS_API int64_t ls_queue_clear(LSStore store);

/// Число заданий или -1 при ошибке
LS_API int64_t ls_queue_count(LSStore store);

// ═══════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════

/// URL бэкенда; пустая строка если не задан, NULL при ошибке
LS_API char* ls_settings_get_backend_url(LSStore store);

/// Сохранить URL бэкенда (только https)
LS_API LSError ls_settings_set_backend_url(LSStore store, const char* url);

// ═══════════════════════════════════════════════════════════
// Upload
// ═══════════════════════════════════════════════════════════

/// Callback события. event = "upload-progress",
/// data_json = {uploadId, loaded, total, done}.
/// @note Вызывается из фонового потока библиотеки
typedef void (*LSEventCallback)(const char* event, const char* data_json, void* user_data);

/// Создать загрузчик
/// @param callback может быть NULL
LS_API LSUploader ls_uploader_create(LSEventCallback callback, void* user_data);

/// Уничтожить загрузчик. Ожидающие события прогресса доставляются до возврата.
LS_API void ls_uploader_destroy(LSUploader uploader);

/// Выполнить загрузку (блокирующий вызов)
/// @param action NULL: "uploadPaymentAttachment"
/// @return JSON ответа сервера или NULL при ошибке
///         (LS_ERROR_TRANSFER_CANCELLED / LS_ERROR_TRANSFER_FAILED)
LS_API char* ls_upload_start(LSUploader uploader, const char* url, const char* payload_json,
                             const char* upload_id, const char* action);

/// Отменить загрузку
/// @return 1 если загрузка активна, 0 если нет, -1 при ошибке
LS_API int32_t ls_upload_cancel(LSUploader uploader, const char* upload_id);

/// Сгенерировать новый id загрузки (UUID)
LS_API char* ls_upload_generate_id(void);

// ═══════════════════════════════════════════════════════════
// Sync
// ═══════════════════════════════════════════════════════════

/// Задать карту инвалидации: {"writeAction": ["readAction", ...], ...}
LS_API LSError ls_sync_set_invalidations(LSStore store, const char* invalidations_json);

/// Один проход по очереди
/// @param url NULL: сохранённый URL бэкенда
/// @return JSON {status, sent, remaining, skipped, error, failedJobId}
///         или NULL при ошибке хранилища
LS_API char* ls_sync_flush(LSStore store, LSUploader uploader, const char* url);

#ifdef __cplusplus
}
#endif

#endif // LOCALSYNC_C_H
