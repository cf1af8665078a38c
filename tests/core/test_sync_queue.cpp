// test_sync_queue.cpp — тесты SyncQueue

#include <gtest/gtest.h>
#include "localsync/Errors.h"
#include "localsync/LocalStore.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <random>
#include <thread>

namespace fs = std::filesystem;
using namespace LocalSync;
using json = nlohmann::json;

class SyncQueueTest : public ::testing::Test {
protected:
    fs::path testDir;
    std::shared_ptr<LocalStore> store;

    void SetUp() override {
        testDir = fs::temp_directory_path() / ("ls_queue_test_" + std::to_string(std::random_device{}()));
        store = LocalStore::open((testDir / "local.db").string());
    }

    void TearDown() override {
        store.reset();
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    SyncQueue& queue() { return store->queue(); }

    static std::vector<int64_t> ids(const std::vector<SyncJob>& jobs) {
        std::vector<int64_t> result;
        for (const auto& job : jobs) {
            result.push_back(job.id);
        }
        return result;
    }
};

TEST_F(SyncQueueTest, EmptyQueue) {
    EXPECT_EQ(queue().count(), 0);
    EXPECT_TRUE(queue().list().empty());
}

TEST_F(SyncQueueTest, AddAssignsStrictlyIncreasingIds) {
    int64_t previous = 0;
    for (int i = 0; i < 10; ++i) {
        int64_t id = queue().add("saveUnit", json{{"n", i}});
        EXPECT_GT(id, previous);
        previous = id;
    }
    EXPECT_EQ(queue().count(), 10);
}

TEST_F(SyncQueueTest, ListReturnsJobsOldestFirst) {
    std::vector<int64_t> added;
    for (int i = 0; i < 5; ++i) {
        added.push_back(queue().add("action" + std::to_string(i), json(i)));
    }

    auto jobs = queue().list(5);
    EXPECT_EQ(ids(jobs), added);
    for (size_t i = 0; i < jobs.size(); ++i) {
        EXPECT_EQ(jobs[i].action, "action" + std::to_string(i));
        EXPECT_EQ(jobs[i].payload, json(static_cast<int>(i)));
    }
}

TEST_F(SyncQueueTest, ListRespectsLimit) {
    for (int i = 0; i < 5; ++i) {
        queue().add("a", json(i));
    }

    auto jobs = queue().list(2);
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].payload, json(0));
    EXPECT_EQ(jobs[1].payload, json(1));

    // list не удаляет задания
    EXPECT_EQ(queue().count(), 5);
}

TEST_F(SyncQueueTest, DefaultsForMethodAndParams) {
    queue().add("savePayment", json{{"amount", 100}});

    auto jobs = queue().list();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].method, "POST");
    EXPECT_EQ(jobs[0].params, json::object());
    EXPECT_GT(jobs[0].createdAt, 0);
}

TEST_F(SyncQueueTest, StoresExplicitMethodParamsAndPayload) {
    json params = {{"tenantId", "t-1"}, {"month", 5}};
    json payload = {{"lines", {1, 2, 3}}, {"note", "ok ✓"}};
    queue().add("saveBillingRecord", payload, "PUT", params);

    auto jobs = queue().list();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].action, "saveBillingRecord");
    EXPECT_EQ(jobs[0].method, "PUT");
    EXPECT_EQ(jobs[0].params, params);
    EXPECT_EQ(jobs[0].payload, payload);
}

TEST_F(SyncQueueTest, NullPayloadStaysNull) {
    queue().add("deleteAttachment", json(nullptr));

    auto jobs = queue().list();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_TRUE(jobs[0].payload.is_null());
}

TEST_F(SyncQueueTest, DeleteMiddleJobScenario) {
    int64_t first = queue().add("a", json(1));
    int64_t second = queue().add("b", json(2));
    int64_t third = queue().add("c", json(3));

    EXPECT_TRUE(queue().remove(second));

    auto jobs = queue().list(10);
    EXPECT_EQ(ids(jobs), (std::vector<int64_t>{first, third}));
    EXPECT_EQ(queue().count(), 2);
}

TEST_F(SyncQueueTest, DeletedIdNeverListedAgain) {
    int64_t id = queue().add("a", json(1));
    EXPECT_TRUE(queue().remove(id));
    EXPECT_FALSE(queue().remove(id));

    queue().add("b", json(2));
    for (const auto& job : queue().list()) {
        EXPECT_NE(job.id, id);
    }
}

TEST_F(SyncQueueTest, ClearRemovesEverything) {
    for (int i = 0; i < 3; ++i) {
        queue().add("a", json(i));
    }

    EXPECT_EQ(queue().clear(), 3);
    EXPECT_EQ(queue().count(), 0);
    EXPECT_EQ(queue().clear(), 0);
}

TEST_F(SyncQueueTest, IdsAreNotReusedAfterClear) {
    queue().add("a", json(1));
    int64_t last = queue().add("a", json(2));
    queue().clear();

    int64_t next = queue().add("a", json(3));
    EXPECT_GT(next, last);
}

TEST_F(SyncQueueTest, RejectsInvalidArguments) {
    EXPECT_THROW(queue().add("", json(1)), QueryError);
    EXPECT_THROW(queue().add("a", json(1), ""), QueryError);
    EXPECT_THROW(queue().list(0), QueryError);
    EXPECT_THROW(queue().list(-5), QueryError);
    EXPECT_EQ(queue().count(), 0);
}

TEST_F(SyncQueueTest, UnserializablePayloadIsRejected) {
    EXPECT_THROW(queue().add("a", json(std::string("\xc3\x28"))), SerializationError);
    EXPECT_EQ(queue().count(), 0);
}

TEST_F(SyncQueueTest, MalformedRowIsReportedByIdAndCanBeRemoved) {
    int64_t broken = queue().add("savePayment", json{{"amount", 1}});
    int64_t healthy = queue().add("saveUnit", json{{"n", 2}});
    store->database()->execute("UPDATE sync_queue SET payload = ? WHERE id = ?", "{broken", broken);

    try {
        queue().list();
        FAIL() << "expected MalformedSyncJobError";
    } catch (const MalformedSyncJobError& e) {
        EXPECT_EQ(e.jobId(), broken);
        EXPECT_EQ(e.kind(), ErrorKind::Serialization);
        EXPECT_NE(std::string(e.what()).find(std::to_string(broken)), std::string::npos);
    }
    EXPECT_EQ(queue().count(), 2);

    // После удаления повреждённой записи очередь снова читается
    EXPECT_TRUE(queue().remove(broken));
    auto jobs = queue().list();
    EXPECT_EQ(ids(jobs), (std::vector<int64_t>{healthy}));
}

TEST_F(SyncQueueTest, MalformedParamsNameTheJob) {
    int64_t id = queue().add("a", json(1), "POST", json{{"k", "v"}});
    store->database()->execute("UPDATE sync_queue SET params = ? WHERE id = ?", "[1,", id);

    try {
        queue().list();
        FAIL() << "expected MalformedSyncJobError";
    } catch (const MalformedSyncJobError& e) {
        EXPECT_EQ(e.jobId(), id);
        EXPECT_NE(std::string(e.what()).find("params"), std::string::npos);
    }
}

TEST_F(SyncQueueTest, JobsSurviveReopen) {
    int64_t first = queue().add("a", json(1));
    int64_t second = queue().add("b", json{{"x", "y"}});
    std::string path = store->path();
    store.reset();

    store = LocalStore::open(path);
    auto jobs = queue().list();
    EXPECT_EQ(ids(jobs), (std::vector<int64_t>{first, second}));
    EXPECT_EQ(jobs[1].payload, (json{{"x", "y"}}));

    int64_t third = queue().add("c", json(3));
    EXPECT_GT(third, second);
}

TEST_F(SyncQueueTest, ConcurrentAddsProduceUniqueIds) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 25;

    std::vector<std::thread> threads;
    std::vector<std::vector<int64_t>> results(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, t, &results]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                results[t].push_back(queue().add("concurrent", json{{"t", t}, {"i", i}}));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<int64_t> all;
    for (const auto& r : results) {
        // Внутри одного потока id возрастают
        EXPECT_TRUE(std::is_sorted(r.begin(), r.end()));
        all.insert(all.end(), r.begin(), r.end());
    }
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
    EXPECT_EQ(queue().count(), THREADS * PER_THREAD);
}
