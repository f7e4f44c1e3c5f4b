// =============================================================================
// frw - Byte-Level File Mutator Implementation
// =============================================================================

#include "frw/io/file_mutator.h"

#include "frw/common/logger.h"
#include "frw/io/file_handle.h"
#include "frw/io/path_resolver.h"

namespace frw::io {

namespace {

/// @brief Current size of @p path, or kGapNotAllowed if @p fromByte is past it.
Result<ByteCount> checkNoGap(std::string_view path, FileOffset fromByte) {
    auto fileSize = statExistingFile(path);
    if (!fileSize) {
        return std::unexpected(std::move(fileSize.error()));
    }
    if (fromByte > *fileSize) {
        return makeError(ErrorCode::kGapNotAllowed, GapError::formatGap(fromByte, *fileSize));
    }
    return *fileSize;
}

}  // namespace

VoidResult overwriteAt(std::string_view path, FileOffset fromByte, ByteView replacement) {
    auto fileSize = checkNoGap(path, fromByte);
    if (!fileSize) {
        return std::unexpected(std::move(fileSize.error()));
    }

    auto file = openForWriteInPlace(path);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }

    if (auto written = file->writeAt(replacement, fromByte); !written) {
        return written;
    }

    FRW_LOG_DEBUG("Overwrote {} byte(s) at offset {} in {} (was {} bytes)", replacement.size(),
                  fromByte, path, *fileSize);
    return file->close();
}

VoidResult insertAt(std::string_view path, FileOffset fromByte, ByteView insertion) {
    auto fileSize = checkNoGap(path, fromByte);
    if (!fileSize) {
        return std::unexpected(std::move(fileSize.error()));
    }

    // Pass 1: save everything after the insert position
    ByteBuffer remainder(static_cast<std::size_t>(*fileSize - fromByte));
    {
        auto reader = openForRead(path);
        if (!reader) {
            return std::unexpected(std::move(reader.error()));
        }
        auto bytesRead = reader->readAt(remainder, fromByte);
        if (!bytesRead) {
            return std::unexpected(std::move(bytesRead.error()));
        }
        remainder.resize(*bytesRead);
        if (auto closed = reader->close(); !closed) {
            return closed;
        }
    }

    // Pass 2: write the insertion, then the saved tail right after it
    auto writer = openForWriteInPlace(path);
    if (!writer) {
        return std::unexpected(std::move(writer.error()));
    }
    if (auto written = writer->writeAt(insertion, fromByte); !written) {
        return written;
    }
    if (auto written = writer->writeAt(remainder, fromByte + insertion.size()); !written) {
        return written;
    }

    FRW_LOG_DEBUG("Inserted {} byte(s) at offset {} in {}, shifted {} byte(s)", insertion.size(),
                  fromByte, path, remainder.size());
    return writer->close();
}

}  // namespace frw::io
