// =============================================================================
// frw - File Writer Tests
// =============================================================================

#include "frw/io/file_writer.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "io/temp_dir.h"

namespace frw::io::test {

using frw::test::TempDir;

// =============================================================================
// filePutContents / fileReadContents
// =============================================================================

TEST(FilePutContentsTest, AppendCreatesAndAppends) {
    TempDir dir;
    const auto path = dir.file("log.txt");
    ASSERT_TRUE(filePutContents(path, "one\n", WriteMode::kAppend, false).has_value());
    ASSERT_TRUE(filePutContents(path, "two\n", WriteMode::kAppend, false).has_value());
    EXPECT_EQ(TempDir::read(path), "one\ntwo\n");
}

TEST(FilePutContentsTest, OverwriteTruncates) {
    TempDir dir;
    const auto path = dir.write("f.txt", "long old content");
    ASSERT_TRUE(filePutContents(path, "new", WriteMode::kOverwrite, false).has_value());
    EXPECT_EQ(TempDir::read(path), "new");
}

TEST(FilePutContentsTest, CreatesParentDirectories) {
    TempDir dir;
    const auto path = dir.file("x/y/z.txt");
    ASSERT_TRUE(filePutContents(path, "deep", WriteMode::kAppend, true).has_value());
    EXPECT_EQ(TempDir::read(path), "deep");
}

TEST(FilePutContentsTest, MissingParentWithoutMkdir) {
    TempDir dir;
    auto result = filePutContents(dir.file("nope/f.txt"), "x", WriteMode::kAppend, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(isFileNotFound(result.error()));
}

TEST(FilePutContentsTest, TrailingSlashRejected) {
    TempDir dir;
    auto result = filePutContents(dir.file("d") + "/", "x", WriteMode::kAppend, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidPath);
}

TEST(FileReadContentsTest, ReadsWholeFile) {
    TempDir dir;
    const auto path = dir.write("f.bin", std::string("a\0b\nc", 5));
    auto content = fileReadContents(path);
    ASSERT_TRUE(content.has_value()) << content.error().message();
    EXPECT_EQ(*content, std::string("a\0b\nc", 5));
}

// =============================================================================
// BufferedWriter
// =============================================================================

TEST(BufferedWriterTest, BuffersUntilFlush) {
    TempDir dir;
    const auto path = dir.file("buffered.txt");
    auto writer = BufferedWriter::create(path, WriteMode::kOverwrite, false, 16);
    ASSERT_TRUE(writer.has_value()) << writer.error().message();

    ASSERT_TRUE(writer->write("abc").has_value());
    EXPECT_EQ(writer->pending(), 3u);
    EXPECT_EQ(TempDir::read(path), "");

    ASSERT_TRUE(writer->flush().has_value());
    EXPECT_EQ(writer->pending(), 0u);
    EXPECT_EQ(TempDir::read(path), "abc");
}

TEST(BufferedWriterTest, FlushesWhenFull) {
    TempDir dir;
    const auto path = dir.file("full.txt");
    auto writer = BufferedWriter::create(path, WriteMode::kOverwrite, false, 8);
    ASSERT_TRUE(writer.has_value());

    ASSERT_TRUE(writer->write("12345").has_value());
    ASSERT_TRUE(writer->write("6789").has_value());
    EXPECT_EQ(TempDir::read(path), "12345");
    EXPECT_EQ(writer->pending(), 4u);

    // Larger than the buffer goes straight to the file
    ASSERT_TRUE(writer->write("abcdefghij").has_value());
    EXPECT_EQ(TempDir::read(path), "123456789abcdefghij");
    EXPECT_EQ(writer->bytesWritten(), 19u);

    ASSERT_TRUE(writer->close().has_value());
    EXPECT_FALSE(writer->isOpen());
}

TEST(BufferedWriterTest, DestructorFlushes) {
    TempDir dir;
    const auto path = dir.file("dtor.txt");
    {
        auto writer = BufferedWriter::create(path, WriteMode::kAppend, false);
        ASSERT_TRUE(writer.has_value());
        ASSERT_TRUE(writer->write("pending").has_value());
    }
    EXPECT_EQ(TempDir::read(path), "pending");
}

TEST(BufferedWriterTest, WriteAfterCloseFails) {
    TempDir dir;
    auto writer = BufferedWriter::create(dir.file("c.txt"), WriteMode::kAppend, false);
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer->close().has_value());

    auto result = writer->write("x");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidState);
}

TEST(BufferedWriterTest, ZeroBufferRejected) {
    TempDir dir;
    auto writer = BufferedWriter::create(dir.file("z.txt"), WriteMode::kAppend, false, 0);
    ASSERT_FALSE(writer.has_value());
    EXPECT_EQ(writer.error().code(), ErrorCode::kInvalidArgument);
}

}  // namespace frw::io::test
