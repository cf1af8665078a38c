#include "localsync/Models.h"

namespace LocalSync {

using json = nlohmann::json;

json toJson(const CacheEntry& entry) {
    return {
        {"key", entry.key},
        {"value", entry.value},
        {"updatedAt", entry.updatedAt}
    };
}

json toJson(const SyncJob& job) {
    return {
        {"id", job.id},
        {"action", job.action},
        {"method", job.method},
        {"params", job.params},
        {"payload", job.payload},
        {"createdAt", job.createdAt}
    };
}

json toJson(const UploadProgress& progress) {
    return {
        {"uploadId", progress.uploadId},
        {"loaded", progress.loaded},
        {"total", progress.total},
        {"done", progress.done}
    };
}

json toJson(const FlushResult& result) {
    json j = {
        {"status", syncStatusToString(result.status)},
        {"sent", result.sent},
        {"remaining", result.remaining},
        {"skipped", result.skipped}
    };
    // null instead of empty string, as for other optional fields
    j["error"] = result.error.empty() ? json(nullptr) : json(result.error);
    j["failedJobId"] = result.failedJobId > 0 ? json(result.failedJobId) : json(nullptr);
    return j;
}

} // namespace LocalSync
