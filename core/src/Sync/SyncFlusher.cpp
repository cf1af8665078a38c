#include "localsync/Sync/SyncFlusher.h"
#include "localsync/Errors.h"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <stdexcept>
#include <utility>
#include <vector>

namespace LocalSync {

namespace {

/// Сбрасывает флаг выполнения при любом выходе из flush
class RunningReset {
public:
    explicit RunningReset(std::atomic<bool>& flag) : m_flag(flag) {}
    ~RunningReset() { m_flag.store(false); }

    RunningReset(const RunningReset&) = delete;
    RunningReset& operator=(const RunningReset&) = delete;

private:
    std::atomic<bool>& m_flag;
};

bool isUnreserved(unsigned char c) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

std::string percentEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (isUnreserved(c)) {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string paramToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Ключи кэша
// ═══════════════════════════════════════════════════════════

std::string cacheKeyPrefix(const std::string& url, const std::string& action) {
    return url + "|" + action + "|";
}

std::string cacheKeyFor(
    const std::string& url,
    const std::string& action,
    const nlohmann::json& params)
{
    std::string query;
    if (params.is_object()) {
        // Объекты nlohmann::json упорядочены по ключу
        for (auto it = params.begin(); it != params.end(); ++it) {
            if (it.value().is_null()) {
                continue;
            }
            if (!query.empty()) {
                query += "&";
            }
            query += it.key() + "=" + percentEncode(paramToString(it.value()));
        }
    }
    return cacheKeyPrefix(url, action) + query;
}

// ═══════════════════════════════════════════════════════════
// SyncFlusher
// ═══════════════════════════════════════════════════════════

SyncFlusher::SyncFlusher(
    std::shared_ptr<LocalStore> store,
    std::shared_ptr<UploadService> uploader,
    FlushOptions options)
    : m_store(std::move(store))
    , m_uploader(std::move(uploader))
    , m_options(std::move(options)) {
    if (!m_store || !m_uploader) {
        throw std::invalid_argument("SyncFlusher requires a store and an uploader");
    }
    if (m_options.batchLimit <= 0) {
        m_options.batchLimit = DEFAULT_QUEUE_LIST_LIMIT;
    }
}

SyncFlusher::~SyncFlusher() = default;

void SyncFlusher::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_onStatus = std::move(callback);
}

void SyncFlusher::notifyStatus(SyncStatus status) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    if (!m_onStatus) {
        return;
    }
    try {
        m_onStatus(status);
    } catch (const std::exception& e) {
        spdlog::warn("SyncFlusher: status callback failed: {}", e.what());
    }
}

nlohmann::json SyncFlusher::buildBody(const SyncJob& job) const {
    nlohmann::json body = {
        {"action", job.action},
        {"payload", job.payload.is_null() ? nlohmann::json::object() : job.payload}
    };
    if (job.params.is_object() && !job.params.empty()) {
        body["params"] = job.params;
    }
    return body;
}

int64_t SyncFlusher::invalidateForWrite(const std::string& url, const std::string& writeAction) {
    auto it = m_options.invalidations.find(writeAction);
    if (url.empty() || it == m_options.invalidations.end()) {
        return 0;
    }

    int64_t removed = 0;
    for (const auto& readAction : it->second) {
        if (readAction.empty()) {
            continue;
        }
        removed += m_store->cache().removePrefix(cacheKeyPrefix(url, readAction));
    }
    if (removed > 0) {
        spdlog::debug("SyncFlusher: {} cached responses dropped after {}", removed, writeAction);
    }
    return removed;
}

FlushResult SyncFlusher::flush(const std::string& url) {
    FlushResult result;

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        result.skipped = true;
        result.status = SyncStatus::Syncing;
        result.remaining = m_store->queue().count();
        return result;
    }
    RunningReset reset(m_running);

    if (url.empty()) {
        result.status = SyncStatus::Pending;
        result.remaining = m_store->queue().count();
        spdlog::info("SyncFlusher: no backend URL, {} jobs left pending", result.remaining);
        notifyStatus(result.status);
        return result;
    }

    std::vector<SyncJob> jobs;
    try {
        jobs = m_store->queue().list(m_options.batchLimit);
    } catch (const MalformedSyncJobError& e) {
        spdlog::error("SyncFlusher: queue blocked by malformed job {}: {}", e.jobId(), e.what());
        result.status = SyncStatus::Pending;
        result.error = e.what();
        result.failedJobId = e.jobId();
        result.remaining = m_store->queue().count();
        notifyStatus(result.status);
        return result;
    }
    if (jobs.empty()) {
        result.status = SyncStatus::Synced;
        notifyStatus(result.status);
        return result;
    }

    notifyStatus(SyncStatus::Syncing);
    spdlog::info("SyncFlusher: flushing {} jobs", jobs.size());

    for (const auto& job : jobs) {
        try {
            m_uploader->send(url, buildBody(job), generateUploadId());
        } catch (const Error& e) {
            spdlog::warn("SyncFlusher: job {} ({}) failed: {}", job.id, job.action, e.what());
            result.error = e.what();
            result.failedJobId = job.id;
            break;
        }

        invalidateForWrite(url, job.action);
        m_store->queue().remove(job.id);
        ++result.sent;
    }

    result.remaining = m_store->queue().count();
    result.status = result.remaining > 0 ? SyncStatus::Pending : SyncStatus::Synced;

    spdlog::info("SyncFlusher: pass finished, sent={} remaining={}", result.sent, result.remaining);
    notifyStatus(result.status);
    return result;
}

} // namespace LocalSync
