// =============================================================================
// frw - Load Command Implementation
// =============================================================================

#include "load_command.h"

#include "frw/common/logger.h"
#include "frw/io/line_splitter.h"

namespace frw::commands {

LoadCommand::LoadCommand(LoadOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

LoadCommand::~LoadCommand() = default;

int LoadCommand::execute() {
    try {
        auto result = (options_.output == LoadOutput::kLines) ? runLines() : runRaw();
        if (!result) {
            const auto& error = result.error();
            if (isFileNotFound(error) || isFileEmpty(error)) {
                FRW_LOG_WARNING("Nothing to load from {}: {}", options_.inputPath,
                                error.message());
            } else {
                FRW_LOG_ERROR("Load failed: {}", error.message());
            }
            return error.exitCode();
        }
        return 0;
    } catch (const FRWException& e) {
        FRW_LOG_ERROR("Load failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        FRW_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

VoidResult LoadCommand::runLines() {
    auto lines = io::fastLoadLines(options_.inputPath, options_.allowEmptyLines,
                                   options_.errorOnEmptyFile, options_.readOptions);
    if (!lines) {
        return std::unexpected(std::move(lines.error()));
    }

    if (options_.printLines) {
        for (const auto& line : *lines) {
            out_ << line << '\n';
        }
    } else {
        out_ << lines->size() << '\n';
    }
    out_.flush();

    FRW_LOG_INFO("Loaded {} line(s) from {}", lines->size(), options_.inputPath);
    return makeVoidSuccess();
}

VoidResult LoadCommand::runRaw() {
    auto bytes = io::parallelRead(options_.inputPath, options_.readOptions);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }

    out_.write(reinterpret_cast<const char*>(bytes->data()),
               static_cast<std::streamsize>(bytes->size()));
    out_.flush();
    if (!out_) {
        return makeError(ErrorCode::kIOError, "failed to write {} bytes to output",
                         bytes->size());
    }
    return makeVoidSuccess();
}

}  // namespace frw::commands
