// ffi_upload.cpp — C API for UploadService and SyncFlusher

#include "ffi_internal.h"
#include "localsync/localsync_c.h"
#include "localsync/Errors.h"
#include "localsync/Models.h"
#include "localsync/Sync/SyncFlusher.h"
#include "localsync/Transfer/HttpTransport.h"
#include "localsync/Transfer/UploadService.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace LocalSync;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// Uploader
// ═══════════════════════════════════════════════════════════

LSUploader ls_uploader_create(LSEventCallback callback, void* user_data) {
    try {
        auto wrapper = std::make_unique<UploaderWrapper>();
        EventObserver observer;
        if (callback) {
            observer = [callback, user_data](const std::string& event, const json& data) {
                std::string payload = data.dump();
                callback(event.c_str(), payload.c_str(), user_data);
            };
        }
        wrapper->channel = std::make_shared<ProgressChannel>(std::move(observer));

        auto channel = wrapper->channel;
        wrapper->service = std::make_shared<UploadService>(
            std::make_shared<CurlHttpTransport>(),
            std::make_shared<CancellationRegistry>(),
            [channel](const UploadProgress& progress) { channel->publish(progress); });

        setLastError(LS_OK);
        return reinterpret_cast<LSUploader>(wrapper.release());
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return nullptr;
    }
}

void ls_uploader_destroy(LSUploader uploader) {
    delete toUploader(uploader);
}

char* ls_upload_start(LSUploader uploader, const char* url, const char* payload_json,
                      const char* upload_id, const char* action) {
    if (!uploader) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, "Null uploader handle");
        return nullptr;
    }

    try {
        auto response = toUploader(uploader)->service->start(
            url ? url : "",
            parseJsonArg(payload_json, json(nullptr)),
            upload_id ? upload_id : "",
            action ? action : DEFAULT_UPLOAD_ACTION);
        setLastError(LS_OK);
        return alloc_string(response.dump());
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return nullptr;
    }
}

int32_t ls_upload_cancel(LSUploader uploader, const char* upload_id) {
    if (!uploader || !upload_id) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, "Null uploader handle or upload id");
        return -1;
    }

    bool found = toUploader(uploader)->service->cancel(upload_id);
    setLastError(LS_OK);
    return found ? 1 : 0;
}

char* ls_upload_generate_id(void) {
    try {
        auto id = generateUploadId();
        setLastError(LS_OK);
        return alloc_string(id);
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return nullptr;
    }
}

// ═══════════════════════════════════════════════════════════
// Sync
// ═══════════════════════════════════════════════════════════

LSError ls_sync_set_invalidations(LSStore store, const char* invalidations_json) {
    if (!store) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, "Null store handle");
        return LS_ERROR_INVALID_ARGUMENT;
    }

    try {
        json j = parseJsonArg(invalidations_json, json::object());
        if (!j.is_object()) {
            setLastError(LS_ERROR_INVALID_ARGUMENT, "Invalidations must be a JSON object");
            return LS_ERROR_INVALID_ARGUMENT;
        }

        std::map<std::string, std::vector<std::string>> invalidations;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_array()) {
                setLastError(LS_ERROR_INVALID_ARGUMENT,
                             "Invalidation targets for " + it.key() + " must be an array");
                return LS_ERROR_INVALID_ARGUMENT;
            }
            auto& targets = invalidations[it.key()];
            for (const auto& target : it.value()) {
                if (!target.is_string()) {
                    setLastError(LS_ERROR_INVALID_ARGUMENT,
                                 "Invalidation target for " + it.key() + " must be a string");
                    return LS_ERROR_INVALID_ARGUMENT;
                }
                targets.push_back(target.get<std::string>());
            }
        }

        auto* wrapper = toStore(store);
        std::lock_guard<std::mutex> lock(wrapper->optionsMutex);
        wrapper->flushOptions.invalidations = std::move(invalidations);
        setLastError(LS_OK);
        return LS_OK;
    } catch (const std::exception& e) {
        return setLastErrorFrom(e);
    }
}

char* ls_sync_flush(LSStore store, LSUploader uploader, const char* url) {
    if (!store || !uploader) {
        setLastError(LS_ERROR_INVALID_ARGUMENT, "Null store or uploader handle");
        return nullptr;
    }

    auto* wrapper = toStore(store);
    try {
        std::unique_lock<std::mutex> running(wrapper->flushMutex, std::try_to_lock);
        if (!running.owns_lock()) {
            FlushResult skipped;
            skipped.skipped = true;
            skipped.status = SyncStatus::Syncing;
            skipped.remaining = wrapper->store->queue().count();
            setLastError(LS_OK);
            return alloc_string(toJson(skipped).dump());
        }

        FlushOptions options;
        {
            std::lock_guard<std::mutex> lock(wrapper->optionsMutex);
            options = wrapper->flushOptions;
        }

        std::string target = url ? std::string(url) : wrapper->store->settings().backendUrl();
        SyncFlusher flusher(wrapper->store, toUploader(uploader)->service, std::move(options));
        auto result = flusher.flush(target);

        setLastError(LS_OK);
        return alloc_string(toJson(result).dump());
    } catch (const std::exception& e) {
        setLastErrorFrom(e);
        return nullptr;
    }
}
