#include "localsync/Transfer/ProgressReader.h"
#include "localsync/Errors.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace LocalSync {

ProgressReader::ProgressReader(
    ByteSource source,
    std::shared_ptr<CancellationFlag> flag,
    std::string uploadId,
    uint64_t total,
    size_t emitEvery,
    ProgressSink sink)
    : m_source(std::move(source))
    , m_flag(std::move(flag))
    , m_uploadId(std::move(uploadId))
    , m_total(total)
    , m_emitEvery(emitEvery)
    , m_sink(std::move(sink)) {
    if (!m_source) {
        throw std::invalid_argument("ProgressReader requires a byte source");
    }
}

size_t ProgressReader::read(uint8_t* buf, size_t len) {
    if (m_flag && m_flag->isCancelled()) {
        spdlog::debug("ProgressReader: upload {} cancelled after {} bytes", m_uploadId, m_sent);
        throw TransferCancelled("Upload cancelled");
    }

    size_t n = m_source(buf, len);

    if (n == 0) {
        if (!m_doneEmitted) {
            emit(true);
        }
        return 0;
    }

    m_sent += n;
    if (m_doneEmitted) {
        return n;
    }
    if (m_sent - m_lastEmit >= m_emitEvery || m_sent >= m_total) {
        emit(m_sent >= m_total);
    }
    return n;
}

void ProgressReader::emit(bool done) {
    m_lastEmit = m_sent;
    if (done) {
        m_doneEmitted = true;
    }
    if (!m_sink) {
        return;
    }

    try {
        m_sink(UploadProgress{m_uploadId, m_sent, m_total, done});
    } catch (const std::exception& e) {
        spdlog::warn("ProgressReader: progress delivery failed for {}: {}", m_uploadId, e.what());
    } catch (...) {
        spdlog::warn("ProgressReader: progress delivery failed for {}", m_uploadId);
    }
}

} // namespace LocalSync
