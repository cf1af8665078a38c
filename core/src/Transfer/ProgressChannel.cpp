#include "localsync/Transfer/ProgressChannel.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace LocalSync {

ProgressChannel::ProgressChannel(EventObserver observer, size_t capacity)
    : m_observer(std::move(observer))
    , m_capacity(capacity > 0 ? capacity : 1) {
    m_running = true;
    m_worker = std::thread([this]() { workerLoop(); });
}

ProgressChannel::~ProgressChannel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }

    if (m_dropped.load() > 0) {
        spdlog::debug("ProgressChannel: {} progress events dropped", m_dropped.load());
    }
}

bool ProgressChannel::publish(const UploadProgress& progress) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running || m_queue.size() >= m_capacity) {
            m_dropped.fetch_add(1);
            return false;
        }
        m_queue.push_back(progress);
    }
    m_cv.notify_one();
    return true;
}

ProgressSink ProgressChannel::sink() {
    return [this](const UploadProgress& progress) { publish(progress); };
}

void ProgressChannel::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this]() { return m_queue.empty() && !m_delivering; });
}

void ProgressChannel::workerLoop() {
    while (true) {
        UploadProgress progress;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                break;
            }

            progress = std::move(m_queue.front());
            m_queue.pop_front();
            m_delivering = true;
        }

        if (m_observer) {
            try {
                m_observer(UPLOAD_PROGRESS_EVENT, toJson(progress));
            } catch (const std::exception& e) {
                spdlog::warn("ProgressChannel: observer failed for {}: {}", progress.uploadId, e.what());
            } catch (...) {
                spdlog::warn("ProgressChannel: observer failed for {}", progress.uploadId);
            }
        }
        m_delivered.fetch_add(1);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_delivering = false;
        }
        m_idleCv.notify_all();
    }

    m_idleCv.notify_all();
}

} // namespace LocalSync
