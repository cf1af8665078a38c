#include "localsync/Transfer/UploadService.h"
#include "localsync/Errors.h"
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace LocalSync {

namespace {

/// Снимает регистрацию флага при выходе из области видимости
class RegistrationGuard {
public:
    RegistrationGuard(CancellationRegistry& registry, std::string uploadId)
        : m_registry(registry), m_uploadId(std::move(uploadId)) {}

    ~RegistrationGuard() {
        m_registry.remove(m_uploadId);
    }

    RegistrationGuard(const RegistrationGuard&) = delete;
    RegistrationGuard& operator=(const RegistrationGuard&) = delete;

private:
    CancellationRegistry& m_registry;
    std::string m_uploadId;
};

} // namespace

UploadService::UploadService(
    std::shared_ptr<HttpTransport> transport,
    std::shared_ptr<CancellationRegistry> registry,
    ProgressSink sink,
    UploadOptions options)
    : m_transport(std::move(transport))
    , m_registry(registry ? std::move(registry) : std::make_shared<CancellationRegistry>())
    , m_sink(std::move(sink))
    , m_options(std::move(options)) {
    if (!m_transport) {
        throw std::invalid_argument("HTTP transport is required");
    }
}

UploadService::~UploadService() = default;

nlohmann::json UploadService::start(
    const std::string& url,
    const nlohmann::json& payload,
    const std::string& uploadId,
    const std::string& action)
{
    nlohmann::json body = {
        {"action", action},
        {"payload", payload}
    };
    return send(url, body, uploadId);
}

nlohmann::json UploadService::send(
    const std::string& url,
    const nlohmann::json& body,
    const std::string& uploadId)
{
    if (url.empty()) {
        throw TransferFailed("Missing backend URL");
    }
    if (uploadId.empty()) {
        throw TransferFailed("Missing upload id");
    }

    std::string serialized;
    try {
        serialized = body.dump();
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Failed to serialize upload body: ") + e.what());
    }

    const uint64_t total = serialized.size();
    auto flag = m_registry->registerUpload(uploadId);
    RegistrationGuard guard(*m_registry, uploadId);

    ProgressReader reader(
        makeMemorySource(std::move(serialized)),
        flag,
        uploadId,
        total,
        m_options.progressEmitEvery,
        m_sink);

    spdlog::info("UploadService: upload {} started ({} bytes)", uploadId, total);

    std::string responseText;
    try {
        responseText = m_transport->post(url, UPLOAD_CONTENT_TYPE, total, reader);
    } catch (const TransferCancelled&) {
        spdlog::info("UploadService: upload {} cancelled after {} of {} bytes",
                     uploadId, reader.sent(), total);
        throw;
    } catch (const TransferFailed& e) {
        spdlog::warn("UploadService: upload {} failed: {}", uploadId, e.what());
        throw;
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(responseText);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("UploadService: upload {} returned non-JSON response", uploadId);
        throw TransferFailed(std::string("Invalid upload response: ") + e.what());
    }

    spdlog::info("UploadService: upload {} completed", uploadId);
    return response;
}

bool UploadService::cancel(const std::string& uploadId) {
    return m_registry->cancel(uploadId);
}

// ═══════════════════════════════════════════════════════════
// generateUploadId
// ═══════════════════════════════════════════════════════════

std::string generateUploadId() {
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw TransferFailed("Failed to generate upload id");
    }

    // UUID v4: версия и вариант
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3],
             bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11],
             bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

} // namespace LocalSync
