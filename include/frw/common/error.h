// =============================================================================
// frw - Error Handling Framework
// =============================================================================
// Error handling for the frw file access library.
//
// This module provides:
// - ErrorCode enum doubling as CLI exit codes
// - FRWException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - ChunkFailure records carried by aggregate parallel-read errors
// - Sentinel checks for "file not found" and "file empty"
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef FRW_COMMON_ERROR_H
#define FRW_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace frw {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes, also used as process exit codes by the frw tool.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error on the command line.
    kUsageError = 1,

    /// @brief Generic I/O error (open/read/write/close failure).
    kIOError = 2,

    /// @brief File does not exist but was required to.
    /// @note Distinguished sentinel, see isFileNotFound().
    kFileNotFound = 3,

    /// @brief Load produced zero lines and the caller asked for an error.
    /// @note Distinguished sentinel, see isFileEmpty().
    kFileEmpty = 4,

    /// @brief Path syntax error (empty, trailing separator, not a file).
    kInvalidPath = 5,

    /// @brief Unknown write mode (only APPEND and OVERWRITE exist).
    kInvalidMode = 6,

    /// @brief One or more chunks of a parallel read failed.
    kChunkReadFailed = 7,

    /// @brief Assembled size differs from the observed file size.
    kSizeMismatch = 8,

    /// @brief Write offset lies beyond the current end of file.
    kGapNotAllowed = 9,

    /// @brief Invalid argument value.
    kInvalidArgument = 10,

    /// @brief Parent directories could not be created.
    kDirectoryCreateFailed = 11,

    /// @brief Invalid state for operation.
    kInvalidState = 12
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileEmpty:
            return "file empty";
        case ErrorCode::kInvalidPath:
            return "invalid path";
        case ErrorCode::kInvalidMode:
            return "invalid mode";
        case ErrorCode::kChunkReadFailed:
            return "chunk read failed";
        case ErrorCode::kSizeMismatch:
            return "size mismatch";
        case ErrorCode::kGapNotAllowed:
            return "gap not allowed";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kDirectoryCreateFailed:
            return "directory create failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}


// =============================================================================
// Chunk Failure Record
// =============================================================================

/// @brief One failed chunk of a parallel read.
/// @note Carried by kChunkReadFailed errors so callers can see which byte
///       ranges failed without parsing the combined message.
struct ChunkFailure {
    /// @brief Index of the failed chunk in the read plan.
    std::size_t chunkIndex = 0;

    /// @brief First byte of the chunk.
    std::uint64_t startOffset = 0;

    /// @brief Bytes the chunk was expected to contain.
    std::uint64_t requestedLength = 0;

    /// @brief Category of the underlying failure.
    ErrorCode code = ErrorCode::kIOError;

    /// @brief Message of the underlying failure.
    std::string message;

    bool operator==(const ChunkFailure&) const = default;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all frw errors.
class FRWException : public std::exception {
public:
    FRWException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ~FRWException() override = default;

    FRWException(const FRWException&) = default;
    FRWException(FRWException&&) noexcept = default;
    FRWException& operator=(const FRWException&) = default;
    FRWException& operator=(FRWException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without the code prefix).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

protected:
    /// @brief Format the what() string as "[code] message".
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors.
class UsageError : public FRWException {
public:
    explicit UsageError(std::string message)
        : FRWException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief Exception for I/O errors.
/// @note Thrown for read/write failures, permission denied, disk full, etc.
class IOError : public FRWException {
public:
    explicit IOError(std::string message)
        : FRWException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief "message: system message" for a system error code.
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);
};

/// @brief Exception for a file that is required to exist but does not.
class FileNotFoundError : public FRWException {
public:
    explicit FileNotFoundError(std::string message)
        : FRWException(ErrorCode::kFileNotFound, std::move(message)) {}
};

/// @brief Exception for a load that produced no lines.
class FileEmptyError : public FRWException {
public:
    explicit FileEmptyError(std::string message = "file empty")
        : FRWException(ErrorCode::kFileEmpty, std::move(message)) {}
};

/// @brief Exception for an assembled buffer whose size differs from the file.
class SizeMismatchError : public FRWException {
public:
    explicit SizeMismatchError(std::string message)
        : FRWException(ErrorCode::kSizeMismatch, std::move(message)) {}

    static std::string formatSizeMismatch(std::uint64_t expected, std::uint64_t actual);
};

/// @brief Exception for a write offset beyond the end of file.
class GapError : public FRWException {
public:
    explicit GapError(std::string message)
        : FRWException(ErrorCode::kGapNotAllowed, std::move(message)) {}

    static std::string formatGap(std::uint64_t offset, std::uint64_t fileSize);
};

/// @brief Exception for a parallel read in which one or more chunks failed.
class ChunkReadError : public FRWException {
public:
    explicit ChunkReadError(std::string message, std::vector<ChunkFailure> failures = {})
        : FRWException(ErrorCode::kChunkReadFailed, std::move(message)),
          failures_(std::move(failures)) {}

    [[nodiscard]] const std::vector<ChunkFailure>& failures() const noexcept { return failures_; }

private:
    std::vector<ChunkFailure> failures_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct an aggregate chunk-read error.
    Error(ErrorCode code, std::string message, std::vector<ChunkFailure> chunkFailures)
        : code_(code), message_(std::move(message)), chunkFailures_(std::move(chunkFailures)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Per-chunk failures (non-empty only for kChunkReadFailed).
    [[nodiscard]] const std::vector<ChunkFailure>& chunkFailures() const noexcept {
        return chunkFailures_;
    }

    /// @brief Throw the exception type matching code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::vector<ChunkFailure> chunkFailures_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error usable as any Result<T>.
/// @param code The error code.
/// @param format fmt-style format string.
/// @param args Format arguments.
template <typename... Args>
[[nodiscard]] std::unexpected<Error> makeError(ErrorCode code,
                                               fmt::format_string<Args...> format,
                                               Args&&... args) {
    return std::unexpected(Error{code, fmt::format(format, std::forward<Args>(args)...)});
}

/// @brief Create an error from an already formatted message.
[[nodiscard]] inline std::unexpected<Error> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

// =============================================================================
// Sentinel Checks
// =============================================================================

/// @brief True if the error means the file did not exist.
[[nodiscard]] inline bool isFileNotFound(const Error& error) noexcept {
    return error.code() == ErrorCode::kFileNotFound;
}

/// @brief True if the error means a load produced no lines.
[[nodiscard]] inline bool isFileEmpty(const Error& error) noexcept {
    return error.code() == ErrorCode::kFileEmpty;
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Build an Error from the current errno value.
/// @param code Error category to report.
/// @param what Operation description, prefixed to the system message.
/// @param errnoValue Saved errno.
[[nodiscard]] Error systemError(ErrorCode code, std::string_view what, int errnoValue);

/// @brief Convert a Result to an exception if it contains an error.
/// @throws FRWException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace frw

#endif  // FRW_COMMON_ERROR_H
