// =============================================================================
// frw - Parallel Reader Tests
// =============================================================================
// The parallel read must return exactly the bytes a sequential read returns,
// whatever the chunk layout and whatever order the chunks come back in.
// =============================================================================

#include "frw/io/parallel_reader.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "frw/io/path_resolver.h"
#include "io/temp_dir.h"

namespace frw::io::test {

using frw::test::patternContent;
using frw::test::TempDir;

namespace {

/// @brief Policy that always uses @p workers chunks.
ChunkPolicy fixedWorkers(std::size_t workers) {
    ChunkPolicy policy;
    policy.smallFileLimit = 0;
    policy.mediumFileLimit = 0;
    policy.largeFileWorkers = workers;
    return policy;
}

std::string toText(const ByteBuffer& bytes) {
    return toString(bytes);
}

}  // namespace

// =============================================================================
// Whole-file Read
// =============================================================================

TEST(ParallelReaderTest, SmallFile) {
    TempDir dir;
    const auto path = dir.write("small.txt", "hello\nworld\n");
    auto bytes = parallelRead(path);
    ASSERT_TRUE(bytes.has_value()) << bytes.error().message();
    EXPECT_EQ(toText(*bytes), "hello\nworld\n");
}

TEST(ParallelReaderTest, EmptyFile) {
    TempDir dir;
    const auto path = dir.write("empty.txt", "");
    auto bytes = parallelRead(path);
    ASSERT_TRUE(bytes.has_value()) << bytes.error().message();
    EXPECT_TRUE(bytes->empty());
}

TEST(ParallelReaderTest, ThreeMebibyteFileWithEightWorkers) {
    TempDir dir;
    const auto content = patternContent(3 * kMiB);
    const auto path = dir.write("three.bin", content);

    EXPECT_EQ(planChunks(content.size()).size(), 8u);
    auto bytes = parallelRead(path);
    ASSERT_TRUE(bytes.has_value()) << bytes.error().message();
    EXPECT_EQ(bytes->size(), content.size());
    EXPECT_TRUE(toText(*bytes) == content);
}

TEST(ParallelReaderTest, SixteenWorkersMatchSequentialRead) {
    TempDir dir;
    const auto content = patternContent(100003);
    const auto path = dir.write("sixteen.bin", content);

    ReadOptions options;
    options.policy = fixedWorkers(16);
    EXPECT_EQ(planChunks(content.size(), options.policy).size(), 16u);

    auto bytes = parallelRead(path, options);
    ASSERT_TRUE(bytes.has_value()) << bytes.error().message();
    EXPECT_TRUE(toText(*bytes) == content);
}

TEST(ParallelReaderTest, RepeatedReadsAreIdentical) {
    TempDir dir;
    const auto path = dir.write("again.bin", patternContent(5000));
    ReadOptions options;
    options.policy = fixedWorkers(7);

    auto first = parallelRead(path, options);
    auto second = parallelRead(path, options);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(ParallelReaderTest, MissingFile) {
    TempDir dir;
    auto bytes = parallelRead(dir.file("missing.bin"));
    ASSERT_FALSE(bytes.has_value());
    EXPECT_TRUE(isFileNotFound(bytes.error()));
}

TEST(ParallelReaderTest, TrailingSlashIsInvalidPath) {
    auto bytes = parallelRead("/tmp/some/dir/");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code(), ErrorCode::kInvalidPath);
}

TEST(ParallelReaderTest, InvalidPolicyRejected) {
    TempDir dir;
    const auto path = dir.write("a.txt", "a");
    ReadOptions options;
    options.policy.smallFileWorkers = 0;
    auto bytes = parallelRead(path, options);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ParallelReaderTest, DirectoryIsInvalidPath) {
    TempDir dir;
    auto bytes = parallelRead(dir.path().string());
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code(), ErrorCode::kInvalidPath);
}

TEST(ParallelReaderTest, SizeComesFromOpenedFile) {
    TempDir dir;
    const auto content = patternContent(70000);
    const auto path = dir.write("sized.bin", content);
    ReadOptions options;
    options.policy = fixedWorkers(16);

    auto bytes = parallelRead(path, options);
    ASSERT_TRUE(bytes.has_value()) << bytes.error().message();
    EXPECT_EQ(bytes->size(), content.size());
    EXPECT_TRUE(toText(*bytes) == content);
}

// =============================================================================
// Fan-out / Fan-in
// =============================================================================

TEST(ParallelReaderTest, EveryTaskRunsAtOnce) {
    // Each task holds its slot until all of them have started, so the peak
    // only reaches taskCount if the tasks really overlap.
    for (const std::size_t taskCount : {std::size_t{1}, std::size_t{8}, std::size_t{16}}) {
        std::mutex mutex;
        std::condition_variable allStarted;
        std::size_t started = 0;
        std::atomic<std::size_t> running{0};
        std::atomic<std::size_t> peak{0};
        std::vector<int> ran(taskCount, 0);

        runConcurrently(taskCount, [&](std::size_t i) {
            const auto now = running.fetch_add(1) + 1;
            auto seen = peak.load();
            while (seen < now && !peak.compare_exchange_weak(seen, now)) {
            }

            std::unique_lock<std::mutex> lock(mutex);
            ++started;
            allStarted.notify_all();
            allStarted.wait_for(lock, std::chrono::seconds(10),
                                [&] { return started == taskCount; });
            ran[i] = 1;
            running.fetch_sub(1);
        });

        EXPECT_EQ(peak.load(), taskCount);
        EXPECT_EQ(std::count(ran.begin(), ran.end(), 1), static_cast<std::ptrdiff_t>(taskCount));
    }
}

TEST(ParallelReaderTest, ZeroTasksIsNoOp) {
    bool called = false;
    runConcurrently(0, [&](std::size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(ParallelReaderTest, AllChunkFailuresAreReported) {
    TempDir dir;
    const auto path = dir.write("wo.bin", patternContent(4000));

    // pread on a write-only descriptor fails with EBADF for every chunk
    auto writeOnly = openForWrite(path, WriteMode::kAppend, false);
    ASSERT_TRUE(writeOnly.has_value());

    auto result = readAll(*writeOnly, planChunks(4000, fixedWorkers(4)));
    ASSERT_FALSE(result.has_value());
    const auto& error = result.error();
    EXPECT_EQ(error.code(), ErrorCode::kChunkReadFailed);
    ASSERT_EQ(error.chunkFailures().size(), 4u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(error.chunkFailures()[i].chunkIndex, i);
        EXPECT_EQ(error.chunkFailures()[i].startOffset, i * 1000);
        EXPECT_EQ(error.chunkFailures()[i].requestedLength, 1000u);
        EXPECT_EQ(error.chunkFailures()[i].code, ErrorCode::kIOError);
    }
    EXPECT_NE(error.message().find("4 chunk read(s) failed"), std::string::npos);
}

TEST(ParallelReaderTest, ClosedHandleIsInvalidState) {
    FileHandle closed;
    auto result = readAll(closed, planChunks(10));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidState);
}

TEST(ParallelReaderTest, ShortReadBecomesSizeMismatch) {
    TempDir dir;
    const auto content = patternContent(1000);
    const auto path = dir.write("short.bin", content);
    auto file = openForRead(path);
    ASSERT_TRUE(file.has_value());

    // Plan as if the file were 100 bytes longer; EOF is not a chunk error
    auto chunks = readAll(*file, planChunks(1100, fixedWorkers(4)));
    ASSERT_TRUE(chunks.has_value()) << chunks.error().message();
    EXPECT_EQ(chunks->back().readLength, 175u);

    auto assembled = assemble(std::move(*chunks), 1100);
    ASSERT_FALSE(assembled.has_value());
    EXPECT_EQ(assembled.error().code(), ErrorCode::kSizeMismatch);
    EXPECT_EQ(assembled.error().message(), "file size error: expected [1100], got [1000] bytes");
}

// =============================================================================
// Reassembly
// =============================================================================

TEST(ParallelReaderTest, AssembleIgnoresArrivalOrder) {
    TempDir dir;
    const auto content = patternContent(12345);
    const auto path = dir.write("order.bin", content);
    auto file = openForRead(path);
    ASSERT_TRUE(file.has_value());

    auto chunks = readAll(*file, planChunks(content.size(), fixedWorkers(9)));
    ASSERT_TRUE(chunks.has_value());
    std::mt19937 rng(7);
    std::shuffle(chunks->begin(), chunks->end(), rng);

    auto assembled = assemble(std::move(*chunks), content.size());
    ASSERT_TRUE(assembled.has_value()) << assembled.error().message();
    EXPECT_TRUE(toText(*assembled) == content);
}

TEST(ParallelReaderTest, AssembleUsesReadLengthOnly) {
    ChunkPlan chunks(2);
    chunks[0].index = 0;
    chunks[0].requestedLength = 4;
    chunks[0].readLength = 4;
    chunks[0].content = {'a', 'b', 'c', 'd'};
    chunks[1].index = 1;
    chunks[1].startOffset = 4;
    chunks[1].requestedLength = 4;
    chunks[1].readLength = 2;
    chunks[1].content = {'e', 'f', 0, 0};

    auto assembled = assemble(std::move(chunks), 6);
    ASSERT_TRUE(assembled.has_value()) << assembled.error().message();
    EXPECT_EQ(toText(*assembled), "abcdef");
}

TEST(ParallelReaderTest, AssembleRejectsMissingChunk) {
    ChunkPlan chunks(2);
    chunks[0].index = 0;
    chunks[1].index = 2;
    auto assembled = assemble(std::move(chunks), 0);
    ASSERT_FALSE(assembled.has_value());
    EXPECT_EQ(assembled.error().code(), ErrorCode::kInvalidArgument);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ParallelReaderProperty, MatchesSequentialRead, ()) {
    const auto content = *rc::gen::container<std::string>(rc::gen::arbitrary<char>());
    const auto workers = *rc::gen::inRange<std::size_t>(1, 20);

    TempDir dir;
    const auto path = dir.write("prop.bin", content);
    ReadOptions options;
    options.policy = fixedWorkers(workers);

    auto bytes = parallelRead(path, options);
    RC_ASSERT(bytes.has_value());
    RC_ASSERT(toText(*bytes) == content);
}

}  // namespace frw::io::test
