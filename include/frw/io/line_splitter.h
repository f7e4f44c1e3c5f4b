// =============================================================================
// frw - Line Splitter
// =============================================================================
// Turns an assembled file buffer into trimmed text lines, and combines it
// with the parallel reader into fastLoadLines().
//
// Lines are separated by '\n'. Each line is trimmed of surrounding Unicode
// whitespace: ASCII spaces plus the UTF-8 encoded White_Space code points
// such as NEL, NBSP and U+2000..U+200A. This also removes the '\r' of CRLF
// files. A last line without a terminating '\n' is kept; the empty remainder
// after a final '\n' is not a line.
// =============================================================================

#ifndef FRW_IO_LINE_SPLITTER_H
#define FRW_IO_LINE_SPLITTER_H

#include <string_view>

#include "frw/common/error.h"
#include "frw/common/types.h"
#include "frw/io/parallel_reader.h"

namespace frw::io {

/// @brief Trim leading and trailing whitespace, ASCII or UTF-8 encoded Unicode.
[[nodiscard]] std::string_view trimWhitespace(std::string_view text) noexcept;

/// @brief Split a buffer into trimmed lines.
/// @param data Buffer to split.
/// @param allowEmptyLines Keep lines that are empty after trimming.
/// @return Lines in file order. "a\n\nb\n" gives {"a", "b"}, or
///         {"a", "", "b"} with allowEmptyLines.
[[nodiscard]] LineBuffer splitLines(ByteView data, bool allowEmptyLines);

/// @brief Load a text file with the parallel reader and split it into lines.
/// @param path File to load.
/// @param allowEmptyLines Keep lines that are empty after trimming.
/// @param returnErrorOnEmptyFile Report kFileEmpty instead of an empty result.
/// @return Lines, or an error. Use isFileNotFound() / isFileEmpty() to tell
///         "nothing to load yet" apart from real failures.
[[nodiscard]] Result<LineBuffer> fastLoadLines(std::string_view path, bool allowEmptyLines,
                                               bool returnErrorOnEmptyFile,
                                               const ReadOptions& options = {});

}  // namespace frw::io

#endif  // FRW_IO_LINE_SPLITTER_H
