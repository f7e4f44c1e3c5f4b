// =============================================================================
// frw - Edit Command
// =============================================================================
// Command handler for the write path of the frw tool.
//
// This module provides:
// - kPut: filePutContents in APPEND or OVERWRITE mode
// - kOverwrite: overwriteAt, replaces bytes in place
// - kInsert: insertAt, shifts the tail of the file
// =============================================================================

#ifndef FRW_COMMANDS_EDIT_COMMAND_H
#define FRW_COMMANDS_EDIT_COMMAND_H

#include <cstdint>
#include <string>

#include "frw/common/error.h"
#include "frw/common/types.h"

namespace frw::commands {

// =============================================================================
// Edit Options
// =============================================================================

enum class EditAction : std::uint8_t {
    kPut = 0,
    kOverwrite = 1,
    kInsert = 2
};

[[nodiscard]] std::string_view editActionToString(EditAction action) noexcept;

/// @brief Configuration options for the edit command.
struct EditOptions {
    EditAction action = EditAction::kPut;

    /// @brief Target file path.
    std::string path;

    /// @brief Bytes to write.
    std::string data;

    /// @brief Write mode name for kPut ("APPEND" or "OVERWRITE").
    std::string mode = "APPEND";

    /// @brief Create missing parent directories (kPut only).
    bool createParents = false;

    /// @brief Byte offset for kOverwrite and kInsert.
    FileOffset offset = 0;
};

// =============================================================================
// EditCommand Class
// =============================================================================

class EditCommand {
public:
    explicit EditCommand(EditOptions options);

    ~EditCommand();

    EditCommand(const EditCommand&) = delete;
    EditCommand& operator=(const EditCommand&) = delete;
    EditCommand(EditCommand&&) noexcept = default;
    EditCommand& operator=(EditCommand&&) noexcept = default;

    /// @brief Execute the edit command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const EditOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] VoidResult run();

    EditOptions options_;
};

}  // namespace frw::commands

#endif  // FRW_COMMANDS_EDIT_COMMAND_H
