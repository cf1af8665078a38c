// Errors.h — закрытая иерархия ошибок LocalSync
// Вызывающий код ветвится по kind(), а не по тексту сообщения

#pragma once

#include "export.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// Виды ошибок
// ═══════════════════════════════════════════════════════════

enum class ErrorKind {
    StoreInit,          // Файловая система / права / схема при старте
    Query,              // Некорректные параметры или отравленный guard
    Serialization,      // Значение не представимо в формате хранения
    TransferCancelled,  // Кооперативная отмена передачи
    TransferFailed      // Сеть, HTTP статус или разбор ответа
};

LS_API const char* errorKindToString(ErrorKind kind);

/// Базовое исключение LocalSync
class LS_API Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

/// Не удалось открыть или подготовить хранилище. Фатально, без повторов.
class LS_API StoreInitError : public Error {
public:
    explicit StoreInitError(const std::string& message)
        : Error(ErrorKind::StoreInit, message) {}
};

class LS_API QueryError : public Error {
public:
    explicit QueryError(const std::string& message)
        : Error(ErrorKind::Query, message) {}
};

class LS_API SerializationError : public Error {
public:
    explicit SerializationError(const std::string& message)
        : Error(ErrorKind::Serialization, message) {}
};

/// Повреждённая запись очереди: id позволяет удалить её через SyncQueue::remove
class LS_API MalformedSyncJobError : public SerializationError {
public:
    MalformedSyncJobError(int64_t jobId, const std::string& message)
        : SerializationError(message), m_jobId(jobId) {}

    int64_t jobId() const noexcept { return m_jobId; }

private:
    int64_t m_jobId;
};

/// Передача отменена пользователем. Никогда не повторяется автоматически.
class LS_API TransferCancelled : public Error {
public:
    explicit TransferCancelled(const std::string& message = "Transfer cancelled")
        : Error(ErrorKind::TransferCancelled, message) {}
};

class LS_API TransferFailed : public Error {
public:
    explicit TransferFailed(const std::string& message)
        : Error(ErrorKind::TransferFailed, message) {}
};

} // namespace LocalSync
