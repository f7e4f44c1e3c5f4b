// =============================================================================
// frw - Error Handling Framework Implementation
// =============================================================================

#include "frw/common/error.h"

namespace frw {

// =============================================================================
// FRWException Implementation
// =============================================================================

void FRWException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
}

// =============================================================================
// Message Formatting
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string SizeMismatchError::formatSizeMismatch(std::uint64_t expected, std::uint64_t actual) {
    return fmt::format("file size error: expected [{}], got [{}] bytes", expected, actual);
}

std::string GapError::formatGap(std::uint64_t offset, std::uint64_t fileSize) {
    return fmt::format("gap not allowed: offset {} is beyond end of file ({} bytes)", offset,
                       fileSize);
}

Error systemError(ErrorCode code, std::string_view what, int errnoValue) {
    const std::error_code ec(errnoValue, std::generic_category());
    return Error{code, IOError::formatWithSystemError(std::string(what), ec)};
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFileNotFound:
            throw FileNotFoundError(message_);
        case ErrorCode::kFileEmpty:
            throw FileEmptyError(message_);
        case ErrorCode::kSizeMismatch:
            throw SizeMismatchError(message_);
        case ErrorCode::kGapNotAllowed:
            throw GapError(message_);
        case ErrorCode::kChunkReadFailed:
            throw ChunkReadError(message_, chunkFailures_);
        default:
            break;
    }
    throw FRWException(code_, message_);
}

}  // namespace frw
