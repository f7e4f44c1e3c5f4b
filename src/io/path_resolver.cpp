// =============================================================================
// frw - Path Resolver Implementation
// =============================================================================

#include "frw/io/path_resolver.h"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>

#include "frw/common/logger.h"

namespace frw::io {

namespace {

constexpr mode_t kFileMode = 0644;

Result<FileHandle> openExisting(std::string_view path, int flags) {
    if (auto size = statExistingFile(path); !size) {
        return std::unexpected(std::move(size.error()));
    }

    std::string pathStr(path);
    const int fd = ::open(pathStr.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        const ErrorCode code = (err == ENOENT) ? ErrorCode::kFileNotFound : ErrorCode::kIOError;
        return std::unexpected(systemError(code, fmt::format("cannot open {}", pathStr), err));
    }
    return FileHandle(fd, std::move(pathStr));
}

}  // namespace

VoidResult validatePathSyntax(std::string_view path) {
    if (path.ends_with('/')) {
        return makeError(ErrorCode::kInvalidPath,
                         "full file path cannot end with \"/\", it should end with file name");
    }
    if (path.empty()) {
        return makeError(ErrorCode::kInvalidPath, "path cannot be empty");
    }
    return makeVoidSuccess();
}

Result<ByteCount> statExistingFile(std::string_view path) {
    if (auto syntax = validatePathSyntax(path); !syntax) {
        return std::unexpected(std::move(syntax.error()));
    }

    const std::filesystem::path fsPath(path);
    std::error_code ec;
    const auto status = std::filesystem::status(fsPath, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return makeError(ErrorCode::kIOError, "cannot stat {}: {}", fsPath.string(), ec.message());
    }
    if (!std::filesystem::exists(status)) {
        return makeError(ErrorCode::kFileNotFound, "file does not exist: {}", fsPath.string());
    }
    if (!std::filesystem::is_regular_file(status)) {
        return makeError(ErrorCode::kInvalidPath, "not a regular file: {}", fsPath.string());
    }

    const auto size = std::filesystem::file_size(fsPath, ec);
    if (ec) {
        return makeError(ErrorCode::kIOError, "cannot get size of {}: {}", fsPath.string(),
                         ec.message());
    }
    return static_cast<ByteCount>(size);
}

Result<WriteMode> parseWriteMode(std::string_view mode) {
    if (mode == "APPEND") {
        return WriteMode::kAppend;
    }
    if (mode == "OVERWRITE") {
        return WriteMode::kOverwrite;
    }
    return makeError(ErrorCode::kInvalidMode,
                     "not supported mode: {}. Only APPEND and OVERWRITE are supported", mode);
}

Result<FileHandle> openForRead(std::string_view path) {
    return openExisting(path, O_RDONLY);
}

Result<FileHandle> openForWriteInPlace(std::string_view path) {
    return openExisting(path, O_WRONLY);
}

Result<FileHandle> openForWrite(std::string_view path, WriteMode mode, bool createParents) {
    if (auto syntax = validatePathSyntax(path); !syntax) {
        return std::unexpected(std::move(syntax.error()));
    }

    const std::filesystem::path fsPath(path);
    const auto parent = fsPath.parent_path();
    if (createParents && !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return makeError(ErrorCode::kDirectoryCreateFailed,
                             "cannot create directory by path \"{}\": {}", parent.string(),
                             ec.message());
        }
        FRW_LOG_DEBUG("Ensured directory {}", parent.string());
    }

    int flags = O_CLOEXEC;
    switch (mode) {
        case WriteMode::kAppend:
            flags |= O_APPEND | O_CREAT | O_WRONLY;
            break;
        case WriteMode::kOverwrite:
            flags |= O_RDWR | O_CREAT | O_TRUNC;
            break;
    }

    const std::string pathStr = fsPath.string();
    const int fd = ::open(pathStr.c_str(), flags, kFileMode);
    if (fd < 0) {
        const int err = errno;
        const ErrorCode code = (err == ENOENT) ? ErrorCode::kFileNotFound : ErrorCode::kIOError;
        return std::unexpected(systemError(
            code, fmt::format("cannot open {} in {} mode", pathStr, writeModeToString(mode)),
            err));
    }
    return FileHandle(fd, pathStr);
}

}  // namespace frw::io
