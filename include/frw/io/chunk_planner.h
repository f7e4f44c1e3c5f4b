// =============================================================================
// frw - Chunk Planner
// =============================================================================
// Splits a file of known size into contiguous byte ranges, one per read task.
//
// The worker count comes from a size-driven ChunkPolicy (1 / 8 / 16 tasks by
// default) and never from the number of available cores. Every chunk but the
// last covers ceil(fileSize / workers) bytes; the last covers the rest.
// =============================================================================

#ifndef FRW_IO_CHUNK_PLANNER_H
#define FRW_IO_CHUNK_PLANNER_H

#include <cstddef>
#include <optional>
#include <vector>

#include "frw/common/error.h"
#include "frw/common/types.h"

namespace frw::io {

// =============================================================================
// Chunk Policy
// =============================================================================

/// @brief Size thresholds that select the number of read tasks.
struct ChunkPolicy {
    /// @brief Files up to this size use smallFileWorkers.
    ByteCount smallFileLimit = kDefaultSmallFileLimit;

    /// @brief Files up to this size use mediumFileWorkers.
    ByteCount mediumFileLimit = kDefaultMediumFileLimit;

    std::size_t smallFileWorkers = kDefaultSmallFileWorkers;
    std::size_t mediumFileWorkers = kDefaultMediumFileWorkers;

    /// @brief Workers for files above mediumFileLimit.
    std::size_t largeFileWorkers = kDefaultLargeFileWorkers;

    /// @brief Number of read tasks for a file of @p fileSize bytes.
    [[nodiscard]] std::size_t workersFor(ByteCount fileSize) const noexcept;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;

    bool operator==(const ChunkPolicy&) const = default;
};

// =============================================================================
// Chunk Descriptor
// =============================================================================

/// @brief One unit of planned read work and, after the read, its outcome.
/// @note Lives for a single read call.
struct ChunkDescriptor {
    /// @brief Position in the plan, 0-based; defines reassembly order.
    std::size_t index = 0;

    /// @brief First byte of the chunk.
    FileOffset startOffset = 0;

    /// @brief Bytes this chunk is expected to contain.
    ByteCount requestedLength = 0;

    /// @brief Bytes actually read (smaller than requested only at EOF).
    ByteCount readLength = 0;

    /// @brief Chunk bytes; sized to requestedLength by the reading task.
    ByteBuffer content;

    /// @brief Set when the read of this chunk failed.
    std::optional<Error> error;

    /// @brief One past the last byte of the chunk.
    [[nodiscard]] FileOffset endOffset() const noexcept { return startOffset + requestedLength; }
};

/// @brief Ordered chunks covering one file.
using ChunkPlan = std::vector<ChunkDescriptor>;

// =============================================================================
// Planning
// =============================================================================

/// @brief Partition @p fileSize bytes into chunks.
/// @param fileSize Size of the file at planning time.
/// @param policy Worker-count policy.
/// @return Chunks with contiguous indices from 0 whose lengths sum to
///         fileSize. A zero-byte file yields one empty chunk.
/// @note If the policy asks for more workers than the size can fill with
///       ceil-sized chunks, the plan is shortened instead of producing empty
///       trailing chunks.
[[nodiscard]] ChunkPlan planChunks(ByteCount fileSize, const ChunkPolicy& policy = {});

}  // namespace frw::io

#endif  // FRW_IO_CHUNK_PLANNER_H
