#include <gtest/gtest.h>
#include "airlink/TransferHistory.hpp"
#include <filesystem>
#include <fstream>
#include <random>

using namespace airlink;
namespace fs = std::filesystem;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static TransferRecord makeRecord(const std::string& id, TransferState state = TransferState::COMPLETED) {
    TransferRecord r;
    r.id = id;
    r.direction = TransferDirection::OUTBOUND;
    r.fromPeerId = "self";
    r.toPeerId = "p1";
    r.peerId = "p1";
    r.resource.name = "report.pdf";
    r.resource.totalSizeBytes = 2048;
    r.resource.contentKind = "application/pdf";
    r.bytesTransferred = state == TransferState::COMPLETED ? 2048 : 512;
    r.state = state;
    r.startedAt = Clock::now();
    r.endedAt = r.startedAt + std::chrono::milliseconds(1500);
    return r;
}

static size_t countLines(const std::string& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) ++n;
    }
    return n;
}

class FileTransferHistoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("airlink_history_" + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

// -----------------------
// MEMORY HISTORY
// -----------------------
TEST(MemoryTransferHistoryTest, KeepsMostRecentEntries) {
    MemoryTransferHistory history(3);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(history.append(makeRecord("t" + std::to_string(i))));
    }

    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().id, "t2");
    EXPECT_EQ(entries.back().id, "t4");
}

TEST(MemoryTransferHistoryTest, ClearEmptiesEntries) {
    MemoryTransferHistory history(10);
    history.append(makeRecord("t1"));
    history.append(makeRecord("t2", TransferState::FAILED));

    EXPECT_TRUE(history.clear());
    EXPECT_EQ(history.size(), 0u);

    history.append(makeRecord("t3"));
    ASSERT_EQ(history.entries().size(), 1u);
    EXPECT_EQ(history.entries()[0].id, "t3");
}

// -----------------------
// LINE CODEC
// -----------------------
TEST(HistoryCodecTest, EncodeDecode) {
    TransferRecord record = makeRecord("abc", TransferState::FAILED);
    record.errorKind = ErrorKind::TIMEOUT;
    record.lastError = "Connect timed out";

    TransferRecord decoded;
    ASSERT_TRUE(FileTransferHistory::decodeRecord(FileTransferHistory::encodeRecord(record), decoded));
    EXPECT_EQ(decoded.id, "abc");
    EXPECT_EQ(decoded.state, TransferState::FAILED);
    EXPECT_EQ(decoded.errorKind, ErrorKind::TIMEOUT);
    EXPECT_EQ(decoded.lastError, "Connect timed out");
    EXPECT_EQ(decoded.resource.name, "report.pdf");
    EXPECT_EQ(decoded.resource.totalSizeBytes, 2048u);
    EXPECT_EQ(decoded.bytesTransferred, 512u);
    EXPECT_NEAR(decoded.durationSeconds(), 1.5, 0.01);
}

TEST(HistoryCodecTest, SeparatorsInFieldsAreNeutralized) {
    TransferRecord record = makeRecord("abc", TransferState::FAILED);
    record.lastError = "bad|pipe\nnewline";

    const std::string line = FileTransferHistory::encodeRecord(record);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    TransferRecord decoded;
    ASSERT_TRUE(FileTransferHistory::decodeRecord(line, decoded));
    EXPECT_EQ(decoded.lastError, "bad/pipe newline");
}

TEST(HistoryCodecTest, EmptyTrailingFieldDecodes) {
    TransferRecord record = makeRecord("ok");
    TransferRecord decoded;
    ASSERT_TRUE(FileTransferHistory::decodeRecord(FileTransferHistory::encodeRecord(record), decoded));
    EXPECT_TRUE(decoded.lastError.empty());
}

TEST(HistoryCodecTest, RejectsMalformedLines) {
    TransferRecord decoded;
    EXPECT_FALSE(FileTransferHistory::decodeRecord("", decoded));
    EXPECT_FALSE(FileTransferHistory::decodeRecord("a|b|c", decoded));
    EXPECT_FALSE(FileTransferHistory::decodeRecord("id|outbound|a|b|c|n|notanumber|k|0|completed|none|0|0|", decoded));
}

// -----------------------
// FILE HISTORY
// -----------------------
TEST_F(FileTransferHistoryTest, InitializeCreatesFile) {
    FileTransferHistory history(dir.string(), 10);
    ASSERT_TRUE(history.initialize());
    EXPECT_TRUE(fs::exists(history.filePath()));
    EXPECT_TRUE(history.load().empty());
}

TEST_F(FileTransferHistoryTest, AppendAndLoad) {
    FileTransferHistory history(dir.string(), 10);
    ASSERT_TRUE(history.initialize());
    ASSERT_TRUE(history.append(makeRecord("t1")));
    ASSERT_TRUE(history.append(makeRecord("t2", TransferState::CANCELLED)));

    auto records = history.load();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "t1");
    EXPECT_EQ(records[1].state, TransferState::CANCELLED);
}

TEST_F(FileTransferHistoryTest, ClearTruncatesFile) {
    FileTransferHistory history(dir.string(), 10);
    ASSERT_TRUE(history.initialize());
    history.append(makeRecord("t1"));
    history.append(makeRecord("t2"));

    ASSERT_TRUE(history.clear());
    EXPECT_TRUE(fs::exists(history.filePath()));
    EXPECT_EQ(fs::file_size(history.filePath()), 0u);
    EXPECT_TRUE(history.load().empty());

    ASSERT_TRUE(history.append(makeRecord("t3")));
    auto records = history.load();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, "t3");
}

TEST_F(FileTransferHistoryTest, ClearKeepsCompactionCountInStep) {
    FileTransferHistory history(dir.string(), 2);
    ASSERT_TRUE(history.initialize());
    for (int i = 0; i < 3; ++i) {
        history.append(makeRecord("a" + std::to_string(i)));
    }
    ASSERT_TRUE(history.clear());

    // Three appends after a clear stay under twice the limit, nothing is dropped
    for (int i = 0; i < 3; ++i) {
        history.append(makeRecord("b" + std::to_string(i)));
    }
    EXPECT_EQ(countLines(history.filePath()), 3u);
}

TEST_F(FileTransferHistoryTest, SurvivesReopen) {
    {
        FileTransferHistory history(dir.string(), 10);
        ASSERT_TRUE(history.initialize());
        history.append(makeRecord("t1"));
    }
    FileTransferHistory reopened(dir.string(), 10);
    ASSERT_TRUE(reopened.initialize());
    auto records = reopened.load();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, "t1");
}

TEST_F(FileTransferHistoryTest, CompactsAtTwiceTheLimit) {
    FileTransferHistory history(dir.string(), 5);
    ASSERT_TRUE(history.initialize());

    for (int i = 0; i < 9; ++i) {
        history.append(makeRecord("t" + std::to_string(i)));
    }
    EXPECT_EQ(countLines(history.filePath()), 9u);

    history.append(makeRecord("t9"));
    EXPECT_EQ(countLines(history.filePath()), 5u);

    auto records = history.load();
    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(records.front().id, "t5");
    EXPECT_EQ(records.back().id, "t9");
}

TEST_F(FileTransferHistoryTest, SkipsMalformedLines) {
    FileTransferHistory history(dir.string(), 10);
    ASSERT_TRUE(history.initialize());
    history.append(makeRecord("t1"));
    {
        std::ofstream out(history.filePath(), std::ios::app);
        out << "garbage line\n";
    }
    history.append(makeRecord("t2"));

    auto records = history.load();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].id, "t2");
}
