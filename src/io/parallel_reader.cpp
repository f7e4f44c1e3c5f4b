// =============================================================================
// frw - Parallel Reader Implementation
// =============================================================================

#include "frw/io/parallel_reader.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>

#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include "frw/common/logger.h"
#include "frw/io/path_resolver.h"

namespace frw::io {

namespace {

/// @brief Body of one chunk task. Only touches its own descriptor.
void readChunk(const FileHandle& file, ChunkDescriptor& chunk) {
    try {
        chunk.content.resize(static_cast<std::size_t>(chunk.requestedLength));
        auto bytesRead = file.readAt(chunk.content, chunk.startOffset);
        if (!bytesRead) {
            chunk.error = std::move(bytesRead.error());
            return;
        }
        // Hitting EOF early is not an error; the assembler catches the shortfall
        chunk.readLength = *bytesRead;
    } catch (const std::exception& e) {
        chunk.error = Error{ErrorCode::kIOError,
                            fmt::format("chunk {} could not be read: {}", chunk.index, e.what())};
    }
}

std::string combineFailures(const std::vector<ChunkFailure>& failures) {
    std::string message = fmt::format("{} chunk read(s) failed: ", failures.size());
    for (const auto& failure : failures) {
        message += fmt::format("[chunk {} @ {}+{}] {}; ", failure.chunkIndex, failure.startOffset,
                               failure.requestedLength, failure.message);
    }
    return message;
}

}  // namespace

// =============================================================================
// Fan-out / Fan-in
// =============================================================================

void runConcurrently(std::size_t taskCount, const std::function<void(std::size_t)>& task) {
    if (taskCount == 0) {
        return;
    }

    // The global limit defaults to the core count and an arena never grows past
    // it. Active limits combine by minimum, so every caller asks for the same
    // ceiling and the arena size alone decides the fan-out.
    tbb::global_control limit(tbb::global_control::max_allowed_parallelism, kMaxWorkers);

    tbb::task_arena arena(static_cast<int>(taskCount));
    arena.execute([&] {
        tbb::task_group group;
        for (std::size_t i = 0; i < taskCount; ++i) {
            group.run([&task, i] { task(i); });
        }
        group.wait();
    });
}

Result<ChunkPlan> readAll(const FileHandle& file, ChunkPlan plan) {
    if (!file.isOpen()) {
        return makeError(ErrorCode::kInvalidState, "readAll called with a closed handle");
    }
    if (plan.empty()) {
        return plan;
    }

    const auto startTime = std::chrono::steady_clock::now();

    runConcurrently(plan.size(), [&file, &plan](std::size_t i) { readChunk(file, plan[i]); });

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - startTime);
    FRW_LOG_DEBUG("Read {} chunk(s) of {} in {} us", plan.size(), file.path(), elapsed.count());

    std::vector<ChunkFailure> failures;
    for (const auto& chunk : plan) {
        if (chunk.error.has_value()) {
            FRW_LOG_WARNING("Chunk {} of {} failed: {}", chunk.index, file.path(),
                            chunk.error->message());
            failures.push_back(ChunkFailure{chunk.index, chunk.startOffset, chunk.requestedLength,
                                            chunk.error->code(), chunk.error->message()});
        }
    }

    if (!failures.empty()) {
        std::string message = combineFailures(failures);
        return std::unexpected(
            Error{ErrorCode::kChunkReadFailed, std::move(message), std::move(failures)});
    }
    return plan;
}

// =============================================================================
// Reassembly
// =============================================================================

Result<ByteBuffer> assemble(ChunkPlan chunks, ByteCount expectedSize) {
    std::sort(chunks.begin(), chunks.end(),
              [](const ChunkDescriptor& a, const ChunkDescriptor& b) { return a.index < b.index; });

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != i) {
            return makeError(ErrorCode::kInvalidArgument,
                             "chunk indices are not contiguous: expected {}, found {}", i,
                             chunks[i].index);
        }
    }

    ByteBuffer assembled;
    assembled.reserve(static_cast<std::size_t>(expectedSize));
    for (const auto& chunk : chunks) {
        const auto length = std::min<std::size_t>(static_cast<std::size_t>(chunk.readLength),
                                                  chunk.content.size());
        assembled.insert(assembled.end(), chunk.content.begin(),
                         chunk.content.begin() + static_cast<std::ptrdiff_t>(length));
    }

    if (assembled.size() != expectedSize) {
        FRW_LOG_WARNING("Assembled {} bytes, expected {}", assembled.size(), expectedSize);
        return makeError(ErrorCode::kSizeMismatch,
                         SizeMismatchError::formatSizeMismatch(expectedSize, assembled.size()));
    }
    return assembled;
}

// =============================================================================
// Whole-file Read
// =============================================================================

Result<ByteBuffer> parallelRead(std::string_view path, const ReadOptions& options) {
    if (auto valid = options.validate(); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    auto file = openForRead(path);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }

    // Size the plan from the open descriptor so it describes the file being read
    auto fileSize = file->size();
    if (!fileSize) {
        return std::unexpected(std::move(fileSize.error()));
    }

    ChunkPlan plan = planChunks(*fileSize, options.policy);
    FRW_LOG_DEBUG("Planned {} chunk(s) for {} ({} bytes)", plan.size(), path, *fileSize);

    auto chunks = readAll(*file, std::move(plan));
    if (!chunks) {
        return std::unexpected(std::move(chunks.error()));
    }

    auto assembled = assemble(std::move(*chunks), *fileSize);

    if (auto closed = file->close(); !closed) {
        return std::unexpected(std::move(closed.error()));
    }
    return assembled;
}

}  // namespace frw::io
