#include "localsync/Transfer/CancellationRegistry.h"
#include <spdlog/spdlog.h>

namespace LocalSync {

std::shared_ptr<CancellationFlag> CancellationRegistry::registerUpload(const std::string& uploadId) {
    auto flag = std::make_shared<CancellationFlag>();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_flags.insert_or_assign(uploadId, flag);
    (void)it;
    if (!inserted) {
        spdlog::warn("CancellationRegistry: upload {} re-registered, previous flag detached", uploadId);
    }
    return flag;
}

bool CancellationRegistry::cancel(const std::string& uploadId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_flags.find(uploadId);
    if (it == m_flags.end()) {
        return false;
    }
    it->second->cancel();
    spdlog::info("CancellationRegistry: upload {} cancelled", uploadId);
    return true;
}

bool CancellationRegistry::remove(const std::string& uploadId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_flags.erase(uploadId) > 0;
}

bool CancellationRegistry::contains(const std::string& uploadId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_flags.find(uploadId) != m_flags.end();
}

size_t CancellationRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_flags.size();
}

} // namespace LocalSync
