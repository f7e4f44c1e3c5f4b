// =============================================================================
// frw - Chunk Planner Implementation
// =============================================================================

#include "frw/io/chunk_planner.h"

#include <algorithm>

namespace frw::io {

// =============================================================================
// ChunkPolicy Implementation
// =============================================================================

std::size_t ChunkPolicy::workersFor(ByteCount fileSize) const noexcept {
    if (fileSize <= smallFileLimit) {
        return smallFileWorkers;
    }
    if (fileSize <= mediumFileLimit) {
        return mediumFileWorkers;
    }
    return largeFileWorkers;
}

VoidResult ChunkPolicy::validate() const {
    if (smallFileLimit > mediumFileLimit) {
        return makeError(ErrorCode::kInvalidArgument,
                         "small file limit ({}) cannot exceed medium file limit ({})",
                         smallFileLimit, mediumFileLimit);
    }
    for (const std::size_t workers : {smallFileWorkers, mediumFileWorkers, largeFileWorkers}) {
        if (workers == 0 || workers > kMaxWorkers) {
            return makeError(ErrorCode::kInvalidArgument,
                             "worker count must be in [1, {}], got {}", kMaxWorkers, workers);
        }
    }
    return makeVoidSuccess();
}

// =============================================================================
// Planning
// =============================================================================

ChunkPlan planChunks(ByteCount fileSize, const ChunkPolicy& policy) {
    const ByteCount requested = std::max<ByteCount>(policy.workersFor(fileSize), 1);
    const ByteCount chunkSize = (fileSize + requested - 1) / requested;

    // Ceil-sized chunks may cover the file before every worker got one
    // (e.g. 9 bytes over 8 workers); drop the would-be empty tail.
    ByteCount workers = requested;
    if (chunkSize > 0) {
        workers = std::min(requested, (fileSize + chunkSize - 1) / chunkSize);
    }
    workers = std::max<ByteCount>(workers, 1);

    ChunkPlan plan(static_cast<std::size_t>(workers));
    FileOffset start = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        auto& chunk = plan[i];
        chunk.index = i;
        chunk.startOffset = start;
        chunk.requestedLength = (i + 1 == plan.size()) ? fileSize - chunkSize * (workers - 1)
                                                       : chunkSize;
        start += chunkSize;
    }
    return plan;
}

}  // namespace frw::io
