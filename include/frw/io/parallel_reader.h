// =============================================================================
// frw - Parallel Reader
// =============================================================================
// Reads a whole file into memory with a fixed fan-out of positioned reads.
//
// Pipeline:
//   openForRead -> size -> planChunks -> readAll (one task per chunk) -> assemble
//
// Key properties:
// - Every chunk task runs to completion; a failing chunk never cancels its
//   siblings. Failures are collected afterwards into one kChunkReadFailed
//   error listing each failed chunk.
// - All tasks share one read-only descriptor and use pread, so no task
//   moves a cursor another task depends on.
// - The caller blocks until every planned chunk has reported.
// - The assembled size must equal the size observed before planning.
//
// Usage:
// @code
// auto bytes = frw::io::parallelRead("data/huge.txt");
// if (!bytes) {
//     for (const auto& failure : bytes.error().chunkFailures()) { ... }
// }
// @endcode
// =============================================================================

#ifndef FRW_IO_PARALLEL_READER_H
#define FRW_IO_PARALLEL_READER_H

#include <cstddef>
#include <functional>
#include <string_view>

#include "frw/common/error.h"
#include "frw/common/types.h"
#include "frw/io/chunk_planner.h"
#include "frw/io/file_handle.h"

namespace frw::io {

/// @brief Options for whole-file reads.
struct ReadOptions {
    /// @brief Worker-count policy used to plan the read.
    ChunkPolicy policy;

    [[nodiscard]] VoidResult validate() const { return policy.validate(); }
};

/// @brief Run task(0) .. task(taskCount - 1) with every call on its own thread.
/// @note All taskCount calls may be in flight at once regardless of the
///       number of cores. Blocks until every call has returned.
void runConcurrently(std::size_t taskCount, const std::function<void(std::size_t)>& task);

/// @brief Read every chunk of @p plan concurrently from @p file.
/// @param file Open, readable handle shared by all tasks.
/// @param plan Chunks to read; consumed.
/// @return The plan with content and readLength filled in, in index order,
///         or a kChunkReadFailed error listing every failed chunk.
/// @note Blocks until all plan.size() tasks have finished.
[[nodiscard]] Result<ChunkPlan> readAll(const FileHandle& file, ChunkPlan plan);

/// @brief Concatenate chunks in index order and verify the total size.
/// @param chunks Chunk results in any order; consumed.
/// @param expectedSize Size of the file when the read was planned.
/// @return Assembled bytes, kInvalidArgument if indices are not contiguous
///         from 0, or kSizeMismatch if the total differs from expectedSize.
[[nodiscard]] Result<ByteBuffer> assemble(ChunkPlan chunks, ByteCount expectedSize);

/// @brief Load a whole file with the parallel chunked reader.
/// @return File bytes, or kFileNotFound / kInvalidPath / kChunkReadFailed /
///         kSizeMismatch / kIOError.
[[nodiscard]] Result<ByteBuffer> parallelRead(std::string_view path,
                                              const ReadOptions& options = {});

}  // namespace frw::io

#endif  // FRW_IO_PARALLEL_READER_H
