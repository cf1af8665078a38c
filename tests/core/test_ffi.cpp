// test_ffi.cpp — Tests for the C API: handles, JSON arguments, error codes

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "localsync/localsync_c.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/// Забирает строку, выделенную библиотекой
std::string take(char* str) {
    if (!str) {
        return "<null>";
    }
    std::string result(str);
    ls_free_string(str);
    return result;
}

} // namespace

class FFITest : public ::testing::Test {
protected:
    std::string tempDir;
    LSStore store = nullptr;

    void SetUp() override {
        tempDir = fs::temp_directory_path().string() + "/ls_ffi_test_" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

        LSError err = LS_ERROR_INTERNAL;
        store = ls_store_open(tempDir.c_str(), &err);
        ASSERT_NE(store, nullptr) << ls_last_error_message();
        EXPECT_EQ(err, LS_OK);
    }

    void TearDown() override {
        if (store) ls_store_close(store);
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }
};

// ═══════════════════════════════════════════════════════════
// Store lifecycle
// ═══════════════════════════════════════════════════════════

TEST_F(FFITest, OpenCreatesDatabaseFile) {
    EXPECT_TRUE(fs::exists(fs::path(tempDir) / "local.db"));
}

TEST(FFIStoreOpenTest, UnusableDataDirReportsStoreInit) {
    std::string base = fs::temp_directory_path().string() + "/ls_ffi_blocker_" +
                       std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    { std::ofstream(base) << "x"; }

    LSError err = LS_OK;
    LSStore store = ls_store_open((base + "/sub").c_str(), &err);
    EXPECT_EQ(store, nullptr);
    EXPECT_EQ(err, LS_ERROR_STORE_INIT);
    EXPECT_EQ(ls_last_error(), LS_ERROR_STORE_INIT);

    std::error_code ec;
    fs::remove(base, ec);
}

TEST(FFIStoreOpenTest, NullHandlesAreInvalidArguments) {
    EXPECT_EQ(ls_store_close(nullptr), LS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ls_cache_get(nullptr, "k"), nullptr);
    EXPECT_EQ(ls_last_error(), LS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ls_queue_count(nullptr), -1);
    EXPECT_EQ(ls_sync_flush(nullptr, nullptr, nullptr), nullptr);
}

// ═══════════════════════════════════════════════════════════
// Cache
// ═══════════════════════════════════════════════════════════

TEST_F(FFITest, CacheGetMissingReturnsEmptyString) {
    EXPECT_EQ(take(ls_cache_get(store, "missing")), "");
    EXPECT_EQ(ls_last_error(), LS_OK);
}

TEST_F(FFITest, CacheSetGetDelete) {
    ASSERT_EQ(ls_cache_set(store, "units", R"({"list":[1,2]})"), LS_OK);

    json entry = json::parse(take(ls_cache_get(store, "units")));
    EXPECT_EQ(entry["key"], "units");
    EXPECT_EQ(entry["value"], (json{{"list", {1, 2}}}));
    EXPECT_GT(entry["updatedAt"].get<int64_t>(), 0);

    EXPECT_EQ(ls_cache_delete(store, "units"), LS_OK);
    EXPECT_EQ(take(ls_cache_get(store, "units")), "");

    // Повторное удаление не ошибка
    EXPECT_EQ(ls_cache_delete(store, "units"), LS_OK);
}

TEST_F(FFITest, CacheSetRejectsMalformedJson) {
    EXPECT_EQ(ls_cache_set(store, "k", "{broken"), LS_ERROR_SERIALIZATION);
    EXPECT_EQ(take(ls_cache_get(store, "k")), "");
}

TEST_F(FFITest, CacheEmptyKeyIsQueryError) {
    EXPECT_EQ(ls_cache_set(store, "", "1"), LS_ERROR_QUERY);
    EXPECT_EQ(ls_cache_set(store, nullptr, "1"), LS_ERROR_INVALID_ARGUMENT);
}

TEST_F(FFITest, CacheDeletePrefixReturnsCount) {
    ls_cache_set(store, "p|a", "1");
    ls_cache_set(store, "p|b", "2");
    ls_cache_set(store, "q|a", "3");

    EXPECT_EQ(ls_cache_delete_prefix(store, "p|"), 2);
    EXPECT_NE(take(ls_cache_get(store, "q|a")), "");
    EXPECT_EQ(ls_cache_delete_prefix(store, nullptr), -1);
}

// ═══════════════════════════════════════════════════════════
// Queue
// ═══════════════════════════════════════════════════════════

TEST_F(FFITest, QueueAddListDelete) {
    int64_t first = ls_queue_add(store, "a", R"({"n":1})", nullptr, nullptr);
    int64_t second = ls_queue_add(store, "b", nullptr, "PUT", R"({"tenantId":"t"})");
    int64_t third = ls_queue_add(store, "c", "3", nullptr, nullptr);
    ASSERT_GT(first, 0);
    ASSERT_GT(second, first);
    ASSERT_GT(third, second);

    EXPECT_EQ(ls_queue_delete(store, second), LS_OK);

    json jobs = json::parse(take(ls_queue_list(store, 0)));
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0]["id"].get<int64_t>(), first);
    EXPECT_EQ(jobs[0]["method"], "POST");
    EXPECT_EQ(jobs[0]["payload"], (json{{"n", 1}}));
    EXPECT_EQ(jobs[1]["id"].get<int64_t>(), third);

    EXPECT_EQ(ls_queue_count(store), 2);
    EXPECT_EQ(ls_queue_clear(store), 2);
    EXPECT_EQ(ls_queue_count(store), 0);
}

TEST_F(FFITest, QueueListLimit) {
    for (int i = 0; i < 4; ++i) {
        ls_queue_add(store, "a", std::to_string(i).c_str(), nullptr, nullptr);
    }
    json jobs = json::parse(take(ls_queue_list(store, 3)));
    EXPECT_EQ(jobs.size(), 3u);
}

TEST_F(FFITest, QueueAddInvalidArguments) {
    EXPECT_EQ(ls_queue_add(store, nullptr, "1", nullptr, nullptr), -1);
    EXPECT_EQ(ls_last_error(), LS_ERROR_INVALID_ARGUMENT);

    EXPECT_EQ(ls_queue_add(store, "", "1", nullptr, nullptr), -1);
    EXPECT_EQ(ls_last_error(), LS_ERROR_QUERY);

    EXPECT_EQ(ls_queue_add(store, "a", "{oops", nullptr, nullptr), -1);
    EXPECT_EQ(ls_last_error(), LS_ERROR_SERIALIZATION);

    EXPECT_EQ(ls_queue_count(store), 0);
}

// ═══════════════════════════════════════════════════════════
// Settings + Sync
// ═══════════════════════════════════════════════════════════

TEST_F(FFITest, BackendUrlRoundTrip) {
    EXPECT_EQ(take(ls_settings_get_backend_url(store)), "");
    EXPECT_EQ(ls_settings_set_backend_url(store, "https://Backend.Example/exec"), LS_OK);
    EXPECT_EQ(take(ls_settings_get_backend_url(store)), "https://backend.example/exec");

    EXPECT_EQ(ls_settings_set_backend_url(store, "http://plain.example"), LS_ERROR_QUERY);
    EXPECT_EQ(ls_settings_set_backend_url(store, nullptr), LS_ERROR_INVALID_ARGUMENT);
}

TEST_F(FFITest, FlushWithoutBackendUrlStaysPending) {
    ls_queue_add(store, "a", "1", nullptr, nullptr);

    LSUploader uploader = ls_uploader_create(nullptr, nullptr);
    ASSERT_NE(uploader, nullptr);

    json result = json::parse(take(ls_sync_flush(store, uploader, nullptr)));
    EXPECT_EQ(result["status"], "pending");
    EXPECT_EQ(result["remaining"].get<int64_t>(), 1);
    EXPECT_EQ(result["sent"].get<int64_t>(), 0);
    EXPECT_FALSE(result["skipped"].get<bool>());

    ls_uploader_destroy(uploader);
    EXPECT_EQ(ls_queue_count(store), 1);
}

TEST_F(FFITest, FlushEmptyQueueIsSynced) {
    LSUploader uploader = ls_uploader_create(nullptr, nullptr);
    json result = json::parse(take(ls_sync_flush(store, uploader, "https://backend.example/exec")));
    EXPECT_EQ(result["status"], "synced");
    EXPECT_TRUE(result["error"].is_null());
    ls_uploader_destroy(uploader);
}

TEST_F(FFITest, MalformedQueueRowIsNamedByListAndFlush) {
    int64_t broken = ls_queue_add(store, "savePayment", R"({"amount":1})", nullptr, nullptr);
    ASSERT_GT(broken, 0);

    // Повредить запись в обход API
    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open((fs::path(tempDir) / "local.db").string().c_str(), &raw), SQLITE_OK);
    std::string sql = "UPDATE sync_queue SET payload = '{broken' WHERE id = " + std::to_string(broken);
    EXPECT_EQ(sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    EXPECT_EQ(ls_queue_list(store, 10), nullptr);
    EXPECT_EQ(ls_last_error(), LS_ERROR_SERIALIZATION);
    EXPECT_NE(std::string(ls_last_error_message()).find("sync job " + std::to_string(broken)),
              std::string::npos);

    LSUploader uploader = ls_uploader_create(nullptr, nullptr);
    ASSERT_NE(uploader, nullptr);
    json result = json::parse(take(ls_sync_flush(store, uploader, "https://backend.example/exec")));
    EXPECT_EQ(result["status"], "pending");
    EXPECT_EQ(result["failedJobId"].get<int64_t>(), broken);
    ls_uploader_destroy(uploader);

    EXPECT_EQ(ls_queue_delete(store, broken), LS_OK);
    EXPECT_EQ(ls_queue_count(store), 0);
}

TEST_F(FFITest, SetInvalidationsValidatesShape) {
    EXPECT_EQ(ls_sync_set_invalidations(store, R"({"savePayment":["listPayments"]})"), LS_OK);
    EXPECT_EQ(ls_sync_set_invalidations(store, R"(["x"])"), LS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ls_sync_set_invalidations(store, R"({"a":"b"})"), LS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ls_sync_set_invalidations(store, R"({"a":[1]})"), LS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ls_sync_set_invalidations(store, "{bad"), LS_ERROR_SERIALIZATION);
}

// ═══════════════════════════════════════════════════════════
// Upload
// ═══════════════════════════════════════════════════════════

TEST(FFIUploadTest, GenerateIdIsUuid) {
    std::string a = take(ls_upload_generate_id());
    std::string b = take(ls_upload_generate_id());
    EXPECT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
}

TEST(FFIUploadTest, StartWithoutUrlFails) {
    LSUploader uploader = ls_uploader_create(nullptr, nullptr);
    ASSERT_NE(uploader, nullptr);

    EXPECT_EQ(ls_upload_start(uploader, "", "{}", "id-1", nullptr), nullptr);
    EXPECT_EQ(ls_last_error(), LS_ERROR_TRANSFER_FAILED);

    EXPECT_EQ(ls_upload_start(uploader, "https://b.example", "{}", nullptr, nullptr), nullptr);
    EXPECT_EQ(ls_last_error(), LS_ERROR_TRANSFER_FAILED);

    ls_uploader_destroy(uploader);
}

TEST(FFIUploadTest, CancelUnknownUploadReturnsZero) {
    LSUploader uploader = ls_uploader_create(nullptr, nullptr);
    EXPECT_EQ(ls_upload_cancel(uploader, "nothing"), 0);
    EXPECT_EQ(ls_upload_cancel(uploader, nullptr), -1);
    EXPECT_EQ(ls_upload_cancel(nullptr, "x"), -1);
    ls_uploader_destroy(uploader);
}

TEST(FFIUploadTest, DestroyNullIsNoOp) {
    ls_uploader_destroy(nullptr);
}

// ═══════════════════════════════════════════════════════════
// Logging + errors
// ═══════════════════════════════════════════════════════════

TEST(FFILoggingTest, LogLevelRange) {
    EXPECT_EQ(ls_set_log_level(0), LS_OK);
    EXPECT_EQ(ls_set_log_level(6), LS_OK);
    EXPECT_EQ(ls_set_log_level(-1), LS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ls_set_log_level(7), LS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ls_set_log_level(2), LS_OK);
}

TEST(FFILoggingTest, LogFileCanBeSetAndReset) {
    std::string path = fs::temp_directory_path().string() + "/ls_ffi_log_" +
                       std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log";

    EXPECT_EQ(ls_set_log_file(path.c_str()), LS_OK);
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(ls_set_log_file(nullptr), LS_OK);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST(FFIErrorTest, ClearErrorResetsState) {
    ls_queue_count(nullptr);
    EXPECT_NE(ls_last_error(), LS_OK);
    EXPECT_STRNE(ls_last_error_message(), "");

    ls_clear_error();
    EXPECT_EQ(ls_last_error(), LS_OK);
    EXPECT_STREQ(ls_last_error_message(), "");
}

TEST(FFIErrorTest, ErrorMessagesForAllCodes) {
    EXPECT_STREQ(ls_error_message(LS_OK), "Success");
    EXPECT_STREQ(ls_error_message(LS_ERROR_TRANSFER_CANCELLED), "Transfer cancelled");
    EXPECT_STREQ(ls_error_message(LS_ERROR_INTERNAL), "Internal error");
}
