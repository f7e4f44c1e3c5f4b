// =============================================================================
// frw - Whole-file Helpers and Buffered Writer Implementation
// =============================================================================

#include "frw/io/file_writer.h"

#include "frw/common/logger.h"
#include "frw/io/path_resolver.h"

namespace frw::io {

// =============================================================================
// Whole-file Helpers
// =============================================================================

VoidResult filePutContents(std::string_view path, std::string_view data, WriteMode mode,
                           bool createParents) {
    auto file = openForWrite(path, mode, createParents);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    if (auto written = file->write(asBytes(data)); !written) {
        return written;
    }
    return file->close();
}

Result<std::string> fileReadContents(std::string_view path) {
    auto fileSize = statExistingFile(path);
    if (!fileSize) {
        return std::unexpected(std::move(fileSize.error()));
    }

    auto file = openForRead(path);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }

    std::string content(static_cast<std::size_t>(*fileSize), '\0');
    auto bytesRead = file->readAt(
        {reinterpret_cast<std::uint8_t*>(content.data()), content.size()}, 0);
    if (!bytesRead) {
        return std::unexpected(std::move(bytesRead.error()));
    }
    content.resize(*bytesRead);

    if (auto closed = file->close(); !closed) {
        return std::unexpected(std::move(closed.error()));
    }
    return content;
}

// =============================================================================
// BufferedWriter Implementation
// =============================================================================

Result<BufferedWriter> BufferedWriter::create(std::string_view path, WriteMode mode,
                                              bool createParents, std::size_t bufferSize) {
    if (bufferSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "buffer size must be > 0");
    }
    auto file = openForWrite(path, mode, createParents);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    return BufferedWriter(std::move(*file), bufferSize);
}

BufferedWriter::BufferedWriter(FileHandle file, std::size_t bufferSize)
    : file_(std::move(file)), capacity_(bufferSize) {
    buffer_.reserve(capacity_);
}

BufferedWriter::~BufferedWriter() {
    if (file_.isOpen()) {
        if (auto result = close(); !result) {
            log::warnFromDestructor("BufferedWriter lost data on close of", file_.path(),
                                    result.error().message());
        }
    }
}

VoidResult BufferedWriter::write(std::string_view data) {
    if (!file_.isOpen()) {
        return makeError(ErrorCode::kInvalidState, "write on a closed BufferedWriter");
    }

    if (buffer_.size() + data.size() > capacity_) {
        if (auto flushed = flush(); !flushed) {
            return flushed;
        }
    }

    const auto bytes = asBytes(data);
    if (bytes.size() >= capacity_) {
        if (auto written = file_.write(bytes); !written) {
            return written;
        }
    } else {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    bytesWritten_ += bytes.size();
    return makeVoidSuccess();
}

VoidResult BufferedWriter::flush() {
    if (buffer_.empty()) {
        return makeVoidSuccess();
    }
    if (!file_.isOpen()) {
        return makeError(ErrorCode::kInvalidState, "flush on a closed BufferedWriter");
    }
    if (auto written = file_.write(buffer_); !written) {
        return written;
    }
    buffer_.clear();
    return makeVoidSuccess();
}

VoidResult BufferedWriter::close() {
    if (!file_.isOpen()) {
        return makeVoidSuccess();
    }
    auto flushed = flush();
    auto closed = file_.close();
    if (!flushed) {
        return flushed;
    }
    return closed;
}

}  // namespace frw::io
