// =============================================================================
// frw - Verify Command
// =============================================================================
// Command handler that checks the parallel reader against a plain sequential
// read of the same file.
//
// Checks:
// - Size: parallel and sequential reads return the same number of bytes
// - Content: XXH3-64 digests of both reads match
// - Repeatability: a second parallel read reproduces the first digest
// =============================================================================

#ifndef FRW_COMMANDS_VERIFY_COMMAND_H
#define FRW_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "frw/common/error.h"
#include "frw/io/parallel_reader.h"

namespace frw::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    std::string checkName;

    bool passed = false;

    /// @brief Error message (if failed).
    std::string errorMessage;

    std::string details;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;

    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

struct VerifyOptions {
    /// @brief File to verify.
    std::string inputPath;

    /// @brief Print each check as it completes.
    bool verbose = false;

    /// @brief Read configuration for the parallel reads.
    io::ReadOptions readOptions;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

class VerifyCommand {
public:
    VerifyCommand(VerifyOptions options, std::ostream& out);

    ~VerifyCommand();

    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = all checks passed).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    void report(const VerificationResult& result);

    void printPlan(std::uint64_t fileSize);

    void printSummary() const;

    VerifyOptions options_;
    std::ostream& out_;
    VerificationSummary summary_;
};

/// @brief XXH3-64 digest of a buffer.
[[nodiscard]] std::uint64_t digest(std::span<const std::uint8_t> data) noexcept;

}  // namespace frw::commands

#endif  // FRW_COMMANDS_VERIFY_COMMAND_H
