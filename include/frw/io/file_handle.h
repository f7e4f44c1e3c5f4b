// =============================================================================
// frw - File Handle
// =============================================================================
// Move-only owner of a POSIX file descriptor with positioned I/O helpers.
//
// readAt() and writeAt() take their offset explicitly (pread/pwrite) and
// never move the descriptor's cursor, so one handle may be shared by many
// concurrent readers without locking.
// =============================================================================

#ifndef FRW_IO_FILE_HANDLE_H
#define FRW_IO_FILE_HANDLE_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "frw/common/error.h"
#include "frw/common/types.h"

namespace frw::io {

/// @brief RAII wrapper around an open file descriptor.
class FileHandle {
public:
    /// @brief Construct an empty (closed) handle.
    FileHandle() = default;

    /// @brief Take ownership of an open descriptor.
    /// @param fd Open descriptor (ownership transferred).
    /// @param path Path the descriptor was opened from, for messages.
    FileHandle(int fd, std::string path) noexcept;

    /// @brief Closes the descriptor if still open (errors are logged).
    ~FileHandle();

    // Non-copyable, movable
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

    /// @brief Current size of the file behind the descriptor.
    [[nodiscard]] Result<ByteCount> size() const;

    /// @brief Positioned read that fills @p buffer unless EOF comes first.
    /// @param buffer Destination; its size is the number of bytes requested.
    /// @param offset File offset of the first byte.
    /// @return Bytes actually read (less than requested only at EOF).
    /// @note Safe to call concurrently on the same handle.
    [[nodiscard]] Result<std::size_t> readAt(std::span<std::uint8_t> buffer,
                                             FileOffset offset) const;

    /// @brief Positioned write of the whole of @p data.
    [[nodiscard]] VoidResult writeAt(ByteView data, FileOffset offset) const;

    /// @brief Sequential write of the whole of @p data at the cursor.
    [[nodiscard]] VoidResult write(ByteView data) const;

    /// @brief Close the descriptor and report any close error.
    [[nodiscard]] VoidResult close();

private:
    int fd_ = -1;
    std::string path_;
};

}  // namespace frw::io

#endif  // FRW_IO_FILE_HANDLE_H
