// =============================================================================
// frw - Byte-Level File Mutator
// =============================================================================
// In-place edits of existing files with unbuffered positioned I/O.
//
// Both operations require fromByte <= current file size. fromByte equal to
// the size appends; anything larger fails with kGapNotAllowed and leaves
// the file untouched, so no sparse region with undefined content is ever
// created.
//
// insertAt() rewrites everything from fromByte to the end of the file. It is
// cheap near the end and expensive near the start of a large file; batch
// inserts when editing near the front.
//
// Neither operation is atomic or guarded against concurrent access to the
// same file.
// =============================================================================

#ifndef FRW_IO_FILE_MUTATOR_H
#define FRW_IO_FILE_MUTATOR_H

#include <string_view>

#include "frw/common/error.h"
#include "frw/common/types.h"

namespace frw::io {

/// @brief Overwrite bytes starting at @p fromByte.
/// @param path Existing file.
/// @param fromByte Offset of the first byte to overwrite (<= file size).
/// @param replacement Bytes to write; the file grows if they run past its end.
/// @return kGapNotAllowed if fromByte is beyond the end of the file.
[[nodiscard]] VoidResult overwriteAt(std::string_view path, FileOffset fromByte,
                                     ByteView replacement);

/// @brief Insert bytes at @p fromByte, shifting the tail of the file.
/// @param path Existing file.
/// @param fromByte Insert position (<= file size).
/// @param insertion Bytes to insert.
/// @return kGapNotAllowed if fromByte is beyond the end of the file.
[[nodiscard]] VoidResult insertAt(std::string_view path, FileOffset fromByte, ByteView insertion);

[[nodiscard]] inline VoidResult overwriteAt(std::string_view path, FileOffset fromByte,
                                            std::string_view replacement) {
    return overwriteAt(path, fromByte, asBytes(replacement));
}

[[nodiscard]] inline VoidResult insertAt(std::string_view path, FileOffset fromByte,
                                         std::string_view insertion) {
    return insertAt(path, fromByte, asBytes(insertion));
}

}  // namespace frw::io

#endif  // FRW_IO_FILE_MUTATOR_H
