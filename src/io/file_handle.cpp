// =============================================================================
// frw - File Handle Implementation
// =============================================================================

#include "frw/io/file_handle.h"

#include <cerrno>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

#include "frw/common/logger.h"

namespace frw::io {

FileHandle::FileHandle(int fd, std::string path) noexcept : fd_(fd), path_(std::move(path)) {}

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        if (auto result = close(); !result) {
            log::warnFromDestructor("Failed to close", path_, result.error().message());
        }
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

Result<ByteCount> FileHandle::size() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        return std::unexpected(
            systemError(ErrorCode::kIOError, fmt::format("cannot stat {}", path_), err));
    }
    return static_cast<ByteCount>(st.st_size);
}

Result<std::size_t> FileHandle::readAt(std::span<std::uint8_t> buffer, FileOffset offset) const {
    std::size_t total = 0;
    while (total < buffer.size()) {
        const ssize_t n = ::pread(fd_, buffer.data() + total, buffer.size() - total,
                                  static_cast<off_t>(offset + total));
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            return std::unexpected(systemError(
                ErrorCode::kIOError,
                fmt::format("read of {} bytes at offset {} in {} failed", buffer.size() - total,
                            offset + total, path_),
                err));
        }
        if (n == 0) {
            break;  // EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return total;
}

VoidResult FileHandle::writeAt(ByteView data, FileOffset offset) const {
    std::size_t total = 0;
    while (total < data.size()) {
        const ssize_t n = ::pwrite(fd_, data.data() + total, data.size() - total,
                                   static_cast<off_t>(offset + total));
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            return std::unexpected(systemError(
                ErrorCode::kIOError,
                fmt::format("write of {} bytes at offset {} in {} failed", data.size() - total,
                            offset + total, path_),
                err));
        }
        total += static_cast<std::size_t>(n);
    }
    return makeVoidSuccess();
}

VoidResult FileHandle::write(ByteView data) const {
    std::size_t total = 0;
    while (total < data.size()) {
        const ssize_t n = ::write(fd_, data.data() + total, data.size() - total);
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            return std::unexpected(systemError(
                ErrorCode::kIOError,
                fmt::format("write of {} bytes to {} failed", data.size() - total, path_), err));
        }
        total += static_cast<std::size_t>(n);
    }
    return makeVoidSuccess();
}

VoidResult FileHandle::close() {
    if (fd_ < 0) {
        return makeVoidSuccess();
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        const int err = errno;
        return std::unexpected(
            systemError(ErrorCode::kIOError, fmt::format("close of {} failed", path_), err));
    }
    return makeVoidSuccess();
}

}  // namespace frw::io
