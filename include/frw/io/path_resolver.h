// =============================================================================
// frw - Path Resolver
// =============================================================================
// Path validation and file opening for the read and mutation paths.
//
// This module provides:
// - Path syntax validation (non-empty, not ending with '/')
// - Existence checks that report the distinguished kFileNotFound error
// - WriteMode parsing ("APPEND" / "OVERWRITE")
// - Opening files for reading, in-place editing, or writing with optional
//   creation of missing parent directories
// =============================================================================

#ifndef FRW_IO_PATH_RESOLVER_H
#define FRW_IO_PATH_RESOLVER_H

#include <string>
#include <string_view>

#include "frw/common/error.h"
#include "frw/common/types.h"
#include "frw/io/file_handle.h"

namespace frw::io {

/// @brief Check path syntax only.
/// @return kInvalidPath if the path is empty or ends with '/'.
[[nodiscard]] VoidResult validatePathSyntax(std::string_view path);

/// @brief Check syntax and existence of a regular file.
/// @return File size in bytes; kFileNotFound if the file does not exist,
///         kInvalidPath if it is not a regular file, kIOError otherwise.
[[nodiscard]] Result<ByteCount> statExistingFile(std::string_view path);

/// @brief Parse a write mode name.
/// @return kInvalidMode for anything but "APPEND" or "OVERWRITE".
[[nodiscard]] Result<WriteMode> parseWriteMode(std::string_view mode);

/// @brief Open an existing file read-only.
[[nodiscard]] Result<FileHandle> openForRead(std::string_view path);

/// @brief Open an existing file write-only without truncating it.
[[nodiscard]] Result<FileHandle> openForWriteInPlace(std::string_view path);

/// @brief Open (creating if needed) a file for writing.
/// @param path Target file path.
/// @param mode kAppend: append/create/write-only; kOverwrite: read-write/create/truncate.
/// @param createParents Create all missing parent directories first.
[[nodiscard]] Result<FileHandle> openForWrite(std::string_view path, WriteMode mode,
                                              bool createParents);

}  // namespace frw::io

#endif  // FRW_IO_PATH_RESOLVER_H
