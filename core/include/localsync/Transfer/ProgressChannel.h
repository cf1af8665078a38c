// ProgressChannel.h — асинхронная доставка событий "upload-progress"
// Наблюдатель не может притормозить передачу: при переполнении событие теряется

#pragma once

#include "../export.h"
#include "../Models.h"
#include "ProgressReader.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace LocalSync {

constexpr const char* UPLOAD_PROGRESS_EVENT = "upload-progress";
constexpr size_t DEFAULT_PROGRESS_QUEUE_CAPACITY = 256;

/// Наблюдатель: имя события + JSON {uploadId, loaded, total, done}
using EventObserver = std::function<void(const std::string& event, const nlohmann::json& data)>;

class LS_API ProgressChannel {
public:
    explicit ProgressChannel(EventObserver observer,
                             size_t capacity = DEFAULT_PROGRESS_QUEUE_CAPACITY);

    /// Останавливает worker; уже поставленные события доставляются
    ~ProgressChannel();

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /// Поставить событие в очередь. Никогда не блокируется на наблюдателе.
    /// @return false если очередь полна и событие отброшено
    bool publish(const UploadProgress& progress);

    /// Адаптер для ProgressReader
    ProgressSink sink();

    /// Дождаться доставки всего, что уже в очереди
    void flush();

    uint64_t delivered() const { return m_delivered.load(); }
    uint64_t dropped() const { return m_dropped.load(); }

private:
    void workerLoop();

    EventObserver m_observer;
    size_t m_capacity;

    std::thread m_worker;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<UploadProgress> m_queue;
    bool m_running = false;
    bool m_delivering = false;

    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace LocalSync
