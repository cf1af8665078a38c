#include "localsync/Types.h"
#include "localsync/Errors.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>

namespace LocalSync {

// ═══════════════════════════════════════════════════════════
// ErrorKind
// ═══════════════════════════════════════════════════════════

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::StoreInit:         return "store_init";
        case ErrorKind::Query:             return "query";
        case ErrorKind::Serialization:     return "serialization";
        case ErrorKind::TransferCancelled: return "transfer_cancelled";
        case ErrorKind::TransferFailed:    return "transfer_failed";
        default:                           return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// SyncStatus
// ═══════════════════════════════════════════════════════════

const char* syncStatusToString(SyncStatus status) {
    switch (status) {
        case SyncStatus::Synced:  return "synced";
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Syncing: return "syncing";
        default:                  return "pending";
    }
}

SyncStatus syncStatusFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "synced")  return SyncStatus::Synced;
    if (lower == "syncing") return SyncStatus::Syncing;
    return SyncStatus::Pending;
}

// ═══════════════════════════════════════════════════════════
// Время
// ═══════════════════════════════════════════════════════════

int64_t nowMillis() {
    static std::atomic<int64_t> lastIssued{0};

    int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

    // Wall clock may step backwards; never hand out a smaller value
    int64_t prev = lastIssued.load(std::memory_order_relaxed);
    while (true) {
        int64_t next = std::max(now, prev);
        if (lastIssued.compare_exchange_weak(prev, next, std::memory_order_relaxed)) {
            return next;
        }
    }
}

} // namespace LocalSync
