// test_progress_reader.cpp — тесты ProgressReader

#include <gtest/gtest.h>
#include "localsync/Errors.h"
#include "localsync/Transfer/ProgressReader.h"
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace LocalSync;

namespace {

/// Прочитать всё до конца потока кусками chunk
std::string drain(ProgressReader& reader, size_t chunk) {
    std::string out;
    std::vector<uint8_t> buf(chunk);
    while (true) {
        size_t n = reader.read(buf.data(), buf.size());
        if (n == 0) break;
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

} // namespace

class ProgressReaderTest : public ::testing::Test {
protected:
    std::vector<UploadProgress> events;

    ProgressSink recorder() {
        return [this](const UploadProgress& p) { events.push_back(p); };
    }

    size_t doneCount() const {
        size_t count = 0;
        for (const auto& e : events) {
            if (e.done) ++count;
        }
        return count;
    }
};

TEST_F(ProgressReaderTest, CancelBeforeFirstReadThrowsTransferCancelled) {
    auto flag = std::make_shared<CancellationFlag>();
    flag->cancel();

    bool sourceCalled = false;
    ByteSource source = [&](uint8_t*, size_t) -> size_t {
        sourceCalled = true;
        return 0;
    };

    ProgressReader reader(source, flag, "u1", 10, 4, recorder());
    uint8_t buf[8];
    EXPECT_THROW(reader.read(buf, sizeof(buf)), TransferCancelled);

    EXPECT_FALSE(sourceCalled);
    EXPECT_EQ(reader.sent(), 0u);
    EXPECT_TRUE(events.empty());
}

TEST_F(ProgressReaderTest, CancelledIsDistinctFromTransferFailed) {
    auto flag = std::make_shared<CancellationFlag>();
    flag->cancel();
    ProgressReader reader(makeMemorySource(std::string("abc")), flag, "u1", 3, 1, nullptr);

    uint8_t buf[4];
    try {
        reader.read(buf, sizeof(buf));
        FAIL() << "expected TransferCancelled";
    } catch (const TransferFailed&) {
        FAIL() << "cancellation reported as TransferFailed";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransferCancelled);
    }
}

TEST_F(ProgressReaderTest, CancelMidStreamStopsAtNextRead) {
    auto flag = std::make_shared<CancellationFlag>();
    ProgressReader reader(makeMemorySource(std::string(100, 'x')), flag, "u1", 100, 10, recorder());

    uint8_t buf[10];
    EXPECT_EQ(reader.read(buf, sizeof(buf)), 10u);
    EXPECT_EQ(reader.read(buf, sizeof(buf)), 10u);

    flag->cancel();
    EXPECT_THROW(reader.read(buf, sizeof(buf)), TransferCancelled);
    EXPECT_EQ(reader.sent(), 20u);
    EXPECT_EQ(doneCount(), 0u);
}

TEST_F(ProgressReaderTest, ReadsWholeSourceUnchanged) {
    std::string data = "The quick brown fox jumps over the lazy dog";
    ProgressReader reader(makeMemorySource(data), nullptr, "u1", data.size(), 8, recorder());

    EXPECT_EQ(drain(reader, 5), data);
    EXPECT_EQ(reader.sent(), data.size());
}

TEST_F(ProgressReaderTest, CoalescesEventsByThreshold) {
    // 1000 байт кусками по 10, порог 100 -> событие каждые 100 байт
    ProgressReader reader(makeMemorySource(std::string(1000, 'a')), nullptr, "u1", 1000, 100, recorder());
    drain(reader, 10);

    ASSERT_EQ(events.size(), 10u);
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].loaded, (i + 1) * 100);
        EXPECT_EQ(events[i].total, 1000u);
        EXPECT_EQ(events[i].uploadId, "u1");
    }
    EXPECT_TRUE(events.back().done);
    EXPECT_EQ(doneCount(), 1u);
}

TEST_F(ProgressReaderTest, EmitsWhenStreamReachesTotalBelowThreshold) {
    // Маленький payload: порог не достигнут, но поток дочитан
    ProgressReader reader(makeMemorySource(std::string(30, 'b')), nullptr, "small", 30, 64 * 1024, recorder());
    drain(reader, 16);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].loaded, 30u);
    EXPECT_TRUE(events[0].done);
}

TEST_F(ProgressReaderTest, EventsAreMonotonic) {
    ProgressReader reader(makeMemorySource(std::string(777, 'c')), nullptr, "u1", 777, 50, recorder());
    drain(reader, 33);

    ASSERT_FALSE(events.empty());
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GT(events[i].loaded, events[i - 1].loaded);
    }
    EXPECT_EQ(events.back().loaded, 777u);
}

TEST_F(ProgressReaderTest, EndOfStreamEmitsDoneWhenTotalOverstated) {
    // Источник короче объявленного total: done приходит на конце потока
    ProgressReader reader(makeMemorySource(std::string(40, 'd')), nullptr, "u1", 100, 1000, recorder());
    drain(reader, 16);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].done);
    EXPECT_EQ(events[0].loaded, 40u);
    EXPECT_EQ(events[0].total, 100u);
}

TEST_F(ProgressReaderTest, EmptySourceEmitsSingleDoneEvent) {
    ProgressReader reader(makeMemorySource(std::string()), nullptr, "empty", 0, 100, recorder());
    uint8_t buf[4];
    EXPECT_EQ(reader.read(buf, sizeof(buf)), 0u);
    EXPECT_EQ(reader.read(buf, sizeof(buf)), 0u);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].done);
    EXPECT_EQ(events[0].loaded, 0u);
}

TEST_F(ProgressReaderTest, ZeroThresholdEmitsPerChunk) {
    ProgressReader reader(makeMemorySource(std::string(50, 'e')), nullptr, "u1", 50, 0, recorder());
    drain(reader, 10);

    EXPECT_EQ(events.size(), 5u);
    EXPECT_EQ(doneCount(), 1u);
}

TEST_F(ProgressReaderTest, SinkFailureDoesNotFailTransfer) {
    int calls = 0;
    ProgressSink failing = [&](const UploadProgress&) {
        ++calls;
        throw std::runtime_error("observer gone");
    };

    std::string data(300, 'f');
    ProgressReader reader(makeMemorySource(data), nullptr, "u1", data.size(), 100, failing);

    EXPECT_EQ(drain(reader, 50), data);
    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(reader.doneEmitted());
}

TEST_F(ProgressReaderTest, NonStandardSinkExceptionDoesNotFailTransfer) {
    int calls = 0;
    ProgressSink failing = [&](const UploadProgress&) {
        ++calls;
        throw "observer gone";
    };

    std::string data(200, 'h');
    ProgressReader reader(makeMemorySource(data), nullptr, "u1", data.size(), 100, failing);

    EXPECT_EQ(drain(reader, 50), data);
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(reader.doneEmitted());
}

TEST_F(ProgressReaderTest, WorksOverStreamSource) {
    std::istringstream input(std::string(256, 'g'));
    ProgressReader reader(makeStreamSource(input), nullptr, "stream", 256, 128, recorder());

    EXPECT_EQ(drain(reader, 100).size(), 256u);
    EXPECT_EQ(doneCount(), 1u);
    EXPECT_EQ(events.back().loaded, 256u);
}

TEST_F(ProgressReaderTest, SourceErrorPropagates) {
    ByteSource broken = [](uint8_t*, size_t) -> size_t {
        throw TransferFailed("disk read error");
    };
    ProgressReader reader(broken, nullptr, "u1", 10, 1, recorder());

    uint8_t buf[4];
    EXPECT_THROW(reader.read(buf, sizeof(buf)), TransferFailed);
}

TEST_F(ProgressReaderTest, RequiresSource) {
    EXPECT_THROW(ProgressReader(ByteSource(), nullptr, "u1", 0, 1, nullptr), std::invalid_argument);
}
