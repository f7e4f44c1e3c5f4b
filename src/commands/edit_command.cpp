// =============================================================================
// frw - Edit Command Implementation
// =============================================================================

#include "edit_command.h"

#include "frw/common/logger.h"
#include "frw/io/file_mutator.h"
#include "frw/io/file_writer.h"
#include "frw/io/path_resolver.h"

namespace frw::commands {

std::string_view editActionToString(EditAction action) noexcept {
    switch (action) {
        case EditAction::kPut:
            return "put";
        case EditAction::kOverwrite:
            return "overwrite";
        case EditAction::kInsert:
            return "insert";
    }
    return "unknown";
}

EditCommand::EditCommand(EditOptions options) : options_(std::move(options)) {}

EditCommand::~EditCommand() = default;

int EditCommand::execute() {
    try {
        if (auto result = run(); !result) {
            FRW_LOG_ERROR("{} failed for {}: {}", editActionToString(options_.action),
                          options_.path, result.error().message());
            return result.error().exitCode();
        }
        FRW_LOG_INFO("{}: wrote {} byte(s) to {}", editActionToString(options_.action),
                     options_.data.size(), options_.path);
        return 0;
    } catch (const FRWException& e) {
        FRW_LOG_ERROR("Edit failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        FRW_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

VoidResult EditCommand::run() {
    switch (options_.action) {
        case EditAction::kPut: {
            auto mode = io::parseWriteMode(options_.mode);
            if (!mode) {
                return std::unexpected(std::move(mode.error()));
            }
            return io::filePutContents(options_.path, options_.data, *mode,
                                       options_.createParents);
        }
        case EditAction::kOverwrite:
            return io::overwriteAt(options_.path, options_.offset,
                                   std::string_view{options_.data});
        case EditAction::kInsert:
            return io::insertAt(options_.path, options_.offset, std::string_view{options_.data});
    }
    return makeError(ErrorCode::kInvalidArgument, "unknown edit action {}",
                     static_cast<int>(options_.action));
}

}  // namespace frw::commands
