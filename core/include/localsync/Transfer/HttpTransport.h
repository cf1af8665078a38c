// HttpTransport.h — транспорт одной HTTP загрузки

#pragma once

#include "../export.h"
#include "../Config.h"
#include "ProgressReader.h"
#include <cstdint>
#include <string>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// HttpTransport: абстрактный транспорт (подменяется в тестах)
// ═══════════════════════════════════════════════════════════

class LS_API HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Один POST: тело читается из reader ровно contentLength байт.
    /// @return тело ответа при статусе 2xx
    /// @throws TransferCancelled если reader обнаружил отмену
    /// @throws TransferFailed при сетевой ошибке или статусе вне 2xx
    virtual std::string post(
        const std::string& url,
        const std::string& contentType,
        uint64_t contentLength,
        ProgressReader& reader) = 0;
};

// ═══════════════════════════════════════════════════════════
// CurlHttpTransport: реализация на libcurl
// ═══════════════════════════════════════════════════════════

class LS_API CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(UploadOptions options = UploadOptions{});
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    std::string post(
        const std::string& url,
        const std::string& contentType,
        uint64_t contentLength,
        ProgressReader& reader) override;

private:
    UploadOptions m_options;
};

} // namespace LocalSync
