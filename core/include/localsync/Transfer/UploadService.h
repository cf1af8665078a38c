// UploadService.h — отменяемая потоковая загрузка с прогрессом
// Одна загрузка = один HTTP POST; без докачки и без повторов

#pragma once

#include "../export.h"
#include "../Config.h"
#include "CancellationRegistry.h"
#include "HttpTransport.h"
#include "ProgressReader.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace LocalSync {

constexpr const char* DEFAULT_UPLOAD_ACTION = "uploadPaymentAttachment";
constexpr const char* UPLOAD_CONTENT_TYPE = "text/plain";

class LS_API UploadService {
public:
    /// @param transport HTTP транспорт (обязателен)
    /// @param registry общий реестр отмены; nullptr = собственный
    /// @param sink получатель прогресса; может быть пустым
    UploadService(
        std::shared_ptr<HttpTransport> transport,
        std::shared_ptr<CancellationRegistry> registry,
        ProgressSink sink,
        UploadOptions options = UploadOptions{});

    ~UploadService();

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

    /// Отправить {"action": action, "payload": payload}
    /// @return разобранный JSON ответа
    /// @throws TransferFailed пустой url/uploadId, сеть, HTTP статус, разбор ответа
    /// @throws TransferCancelled если загрузку отменили
    /// @throws SerializationError если payload не сериализуется
    nlohmann::json start(
        const std::string& url,
        const nlohmann::json& payload,
        const std::string& uploadId,
        const std::string& action = DEFAULT_UPLOAD_ACTION);

    /// Отправить готовое тело запроса. Регистрация флага и её снятие:
    /// внутри, при любом исходе.
    nlohmann::json send(
        const std::string& url,
        const nlohmann::json& body,
        const std::string& uploadId);

    /// Запросить отмену; вступает в силу на следующей границе чтения
    /// @return true если загрузка с таким id активна
    bool cancel(const std::string& uploadId);

    CancellationRegistry& registry() { return *m_registry; }
    const UploadOptions& options() const { return m_options; }

private:
    std::shared_ptr<HttpTransport> m_transport;
    std::shared_ptr<CancellationRegistry> m_registry;
    ProgressSink m_sink;
    UploadOptions m_options;
};

/// Случайный id загрузки в формате UUID (OpenSSL RAND_bytes)
/// @throws TransferFailed если генератор случайных чисел недоступен
LS_API std::string generateUploadId();

} // namespace LocalSync
