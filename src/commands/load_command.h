// =============================================================================
// frw - Load Command
// =============================================================================
// Command handler for the read path of the frw tool.
//
// This module provides:
// - LoadCommand in kLines mode: fastLoadLines, prints the line count and
//   optionally the lines
// - LoadCommand in kRaw mode: parallelRead, copies the bytes to stdout
// =============================================================================

#ifndef FRW_COMMANDS_LOAD_COMMAND_H
#define FRW_COMMANDS_LOAD_COMMAND_H

#include <cstdint>
#include <ostream>
#include <string>

#include "frw/common/error.h"
#include "frw/io/parallel_reader.h"

namespace frw::commands {

// =============================================================================
// Load Options
// =============================================================================

/// @brief What the load command prints.
enum class LoadOutput : std::uint8_t {
    /// @brief Split into lines, print the count (and lines if requested).
    kLines = 0,

    /// @brief Raw file bytes.
    kRaw = 1
};

/// @brief Configuration options for the load command.
struct LoadOptions {
    /// @brief Input file path.
    std::string inputPath;

    LoadOutput output = LoadOutput::kLines;

    /// @brief Keep lines that are empty after trimming.
    bool allowEmptyLines = false;

    /// @brief Treat a file without lines as an error.
    bool errorOnEmptyFile = false;

    /// @brief Print every line, not only the count.
    bool printLines = false;

    /// @brief Read configuration.
    io::ReadOptions readOptions;
};

// =============================================================================
// LoadCommand Class
// =============================================================================

class LoadCommand {
public:
    explicit LoadCommand(LoadOptions options, std::ostream& out);

    ~LoadCommand();

    // Non-copyable, non-movable (holds a stream reference)
    LoadCommand(const LoadCommand&) = delete;
    LoadCommand& operator=(const LoadCommand&) = delete;

    /// @brief Execute the load command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const LoadOptions& options() const noexcept { return options_; }

private:
    VoidResult runLines();
    VoidResult runRaw();

    LoadOptions options_;
    std::ostream& out_;
};

}  // namespace frw::commands

#endif  // FRW_COMMANDS_LOAD_COMMAND_H
