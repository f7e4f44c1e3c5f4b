// =============================================================================
// frw - Common Type Definitions
// =============================================================================
// Core type definitions shared by the read and mutation paths.
//
// This module defines:
// - ByteBuffer, LineBuffer: owned file content
// - FileOffset, ByteCount: byte positions and sizes
// - WriteMode: the two supported open modes for writers
// - Size constants used by the default chunk policy
// =============================================================================

#ifndef FRW_COMMON_TYPES_H
#define FRW_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace frw {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Byte position inside a file.
using FileOffset = std::uint64_t;

/// @brief Number of bytes.
using ByteCount = std::uint64_t;

/// @brief Owned, contiguous file content.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Read-only view over bytes.
using ByteView = std::span<const std::uint8_t>;

/// @brief Ordered trimmed lines of one loaded file.
using LineBuffer = std::vector<std::string>;

// =============================================================================
// Constants
// =============================================================================

inline constexpr ByteCount kKiB = 1024;
inline constexpr ByteCount kMiB = 1024 * kKiB;

/// @brief Files up to this size are read by a single task (1 MiB).
inline constexpr ByteCount kDefaultSmallFileLimit = 1 * kMiB;

/// @brief Files up to this size are read by the medium worker count (128 MiB).
inline constexpr ByteCount kDefaultMediumFileLimit = 128 * kMiB;

inline constexpr std::size_t kDefaultSmallFileWorkers = 1;
inline constexpr std::size_t kDefaultMediumFileWorkers = 8;
inline constexpr std::size_t kDefaultLargeFileWorkers = 16;

/// @brief Upper bound accepted for any configured worker count.
inline constexpr std::size_t kMaxWorkers = 256;

/// @brief Default BufferedWriter buffer size.
inline constexpr std::size_t kDefaultWriteBufferSize = 4096;

// =============================================================================
// Write Mode Enumeration
// =============================================================================

/// @brief Open mode for writers.
enum class WriteMode : std::uint8_t {
    /// @brief Create if missing, always write at the end.
    kAppend = 0,

    /// @brief Create if missing, truncate existing content.
    kOverwrite = 1
};

[[nodiscard]] constexpr std::string_view writeModeToString(WriteMode mode) noexcept {
    switch (mode) {
        case WriteMode::kAppend:
            return "APPEND";
        case WriteMode::kOverwrite:
            return "OVERWRITE";
    }
    return "UNKNOWN";
}

// =============================================================================
// Helpers
// =============================================================================

/// @brief View a string's characters as bytes.
[[nodiscard]] inline ByteView asBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

/// @brief Copy bytes into a string.
[[nodiscard]] inline std::string toString(ByteView bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace frw

#endif  // FRW_COMMON_TYPES_H
