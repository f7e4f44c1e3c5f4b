// =============================================================================
// frw - Whole-file Helpers and Buffered Writer
// =============================================================================
// Simple sequential helpers around the path resolver:
// - filePutContents: write a string to a file in APPEND or OVERWRITE mode
// - fileReadContents: single-threaded read of a whole file
// - BufferedWriter: many small writes batched into few system calls
//
// Usage:
// @code
// auto writer = BufferedWriter::create("out/data.txt", WriteMode::kOverwrite, true);
// if (!writer) { ... }
// for (const auto& row : rows) {
//     if (auto r = writer->write(row); !r) { ... }
// }
// if (auto r = writer->close(); !r) { ... }
// @endcode
// =============================================================================

#ifndef FRW_IO_FILE_WRITER_H
#define FRW_IO_FILE_WRITER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "frw/common/error.h"
#include "frw/common/types.h"
#include "frw/io/file_handle.h"

namespace frw::io {

/// @brief Write @p data to @p path.
/// @param createParents Create missing parent directories first.
[[nodiscard]] VoidResult filePutContents(std::string_view path, std::string_view data,
                                         WriteMode mode, bool createParents);

/// @brief Read a whole file sequentially into a string.
[[nodiscard]] Result<std::string> fileReadContents(std::string_view path);

// =============================================================================
// Buffered Writer
// =============================================================================

/// @brief Sequential writer that batches small writes.
///
/// Data is kept in memory until the buffer is full, flush() or close() is
/// called. Writes larger than the buffer go straight to the file after the
/// pending data.
class BufferedWriter {
public:
    /// @brief Open @p path and create a writer for it.
    [[nodiscard]] static Result<BufferedWriter> create(std::string_view path, WriteMode mode,
                                                       bool createParents,
                                                       std::size_t bufferSize = kDefaultWriteBufferSize);

    /// @brief Flushes and closes if close() was not called (errors are logged).
    ~BufferedWriter();

    // Non-copyable, movable
    BufferedWriter(const BufferedWriter&) = delete;
    BufferedWriter& operator=(const BufferedWriter&) = delete;
    BufferedWriter(BufferedWriter&&) noexcept = default;
    BufferedWriter& operator=(BufferedWriter&&) noexcept = default;

    /// @brief Append @p data to the file.
    [[nodiscard]] VoidResult write(std::string_view data);

    /// @brief Write pending data to the file.
    [[nodiscard]] VoidResult flush();

    /// @brief Flush pending data and close the file.
    [[nodiscard]] VoidResult close();

    /// @brief Bytes accepted by write() so far.
    [[nodiscard]] ByteCount bytesWritten() const noexcept { return bytesWritten_; }

    /// @brief Bytes waiting in the buffer.
    [[nodiscard]] std::size_t pending() const noexcept { return buffer_.size(); }

    [[nodiscard]] bool isOpen() const noexcept { return file_.isOpen(); }

private:
    BufferedWriter(FileHandle file, std::size_t bufferSize);

    FileHandle file_;
    std::vector<std::uint8_t> buffer_;
    std::size_t capacity_ = kDefaultWriteBufferSize;
    ByteCount bytesWritten_ = 0;
};

}  // namespace frw::io

#endif  // FRW_IO_FILE_WRITER_H
