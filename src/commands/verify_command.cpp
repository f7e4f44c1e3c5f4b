// =============================================================================
// frw - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <xxhash.h>

#include "frw/common/logger.h"
#include "frw/io/chunk_planner.h"
#include "frw/io/file_writer.h"
#include "frw/io/path_resolver.h"

namespace frw::commands {

std::uint64_t digest(std::span<const std::uint8_t> data) noexcept {
    return XXH3_64bits(data.data(), data.size());
}

VerifyCommand::VerifyCommand(VerifyOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

VerifyCommand::~VerifyCommand() = default;

int VerifyCommand::execute() {
    try {
        const auto fileSize = unwrapOrThrow(io::statExistingFile(options_.inputPath));
        out_ << "Verifying: " << options_.inputPath << '\n';
        printPlan(fileSize);

        const auto parallel = unwrapOrThrow(io::parallelRead(options_.inputPath,
                                                             options_.readOptions));
        const auto sequential = unwrapOrThrow(io::fileReadContents(options_.inputPath));
        const auto parallelDigest = digest(parallel);
        const auto sequentialDigest = digest(asBytes(sequential));

        VerificationResult sizeCheck;
        sizeCheck.checkName = "Size";
        sizeCheck.passed = parallel.size() == sequential.size();
        sizeCheck.details = fmt::format("parallel {} bytes, sequential {} bytes", parallel.size(),
                                        sequential.size());
        if (!sizeCheck.passed) {
            sizeCheck.errorMessage = "parallel read size differs from sequential read";
        }
        report(sizeCheck);

        VerificationResult contentCheck;
        contentCheck.checkName = "Content digest";
        contentCheck.passed = parallelDigest == sequentialDigest;
        contentCheck.details = fmt::format("parallel 0x{:016x}, sequential 0x{:016x}",
                                           parallelDigest, sequentialDigest);
        if (!contentCheck.passed) {
            contentCheck.errorMessage = "parallel read content differs from sequential read";
        }
        report(contentCheck);

        const auto again = unwrapOrThrow(io::parallelRead(options_.inputPath,
                                                          options_.readOptions));
        const auto againDigest = digest(again);

        VerificationResult repeatCheck;
        repeatCheck.checkName = "Repeat read";
        repeatCheck.passed = againDigest == parallelDigest;
        repeatCheck.details = fmt::format("first 0x{:016x}, second 0x{:016x}", parallelDigest,
                                          againDigest);
        if (!repeatCheck.passed) {
            repeatCheck.errorMessage = "file content changed between reads";
        }
        report(repeatCheck);

        printSummary();
        return summary_.passed() ? 0 : toExitCode(ErrorCode::kSizeMismatch);

    } catch (const FRWException& e) {
        FRW_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        FRW_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void VerifyCommand::report(const VerificationResult& result) {
    if (options_.verbose) {
        out_ << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName << ": "
             << result.details << '\n';
    }
    if (!result.passed) {
        FRW_LOG_ERROR("{}: {} ({})", result.checkName, result.errorMessage, result.details);
    }
    summary_.addResult(result);
}

void VerifyCommand::printPlan(std::uint64_t fileSize) {
    const auto plan = io::planChunks(fileSize, options_.readOptions.policy);
    out_ << "File size: " << fileSize << " bytes, " << plan.size() << " chunk(s)\n";
    for (const auto& chunk : plan) {
        out_ << "  chunk " << chunk.index << ": [" << chunk.startOffset << ", "
             << chunk.endOffset() << ")\n";
    }
}

void VerifyCommand::printSummary() const {
    out_ << (summary_.passed() ? "OK" : "FAILED") << ": " << summary_.passedChecks << "/"
         << summary_.totalChecks << " checks passed\n";
}

}  // namespace frw::commands
