// =============================================================================
// frw - Line Splitter Implementation
// =============================================================================

#include "frw/io/line_splitter.h"

#include <algorithm>

#include "frw/common/logger.h"

namespace frw::io {

namespace {

constexpr std::string_view kAsciiWhitespace = " \t\n\v\f\r";

/// @brief Length of the whitespace code point @p text starts with, or 0.
/// Covers the Unicode White_Space set encoded as UTF-8; malformed
/// sequences are never whitespace.
std::size_t leadingSpaceLength(std::string_view text) noexcept {
    if (text.empty()) {
        return 0;
    }
    if (kAsciiWhitespace.find(text[0]) != std::string_view::npos) {
        return 1;
    }

    const auto byte = [&text](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    if (text.size() >= 2 && byte(0) == 0xC2) {
        // U+0085 NEL, U+00A0 NBSP
        return (byte(1) == 0x85 || byte(1) == 0xA0) ? 2 : 0;
    }
    if (text.size() < 3) {
        return 0;
    }
    const auto lead = byte(0);
    const auto mid = byte(1);
    const auto last = byte(2);
    if (lead == 0xE1) {
        return (mid == 0x9A && last == 0x80) ? 3 : 0;  // U+1680
    }
    if (lead == 0xE2 && mid == 0x80) {
        // U+2000..U+200A, U+2028, U+2029, U+202F
        const bool space = (last >= 0x80 && last <= 0x8A) || last == 0xA8 || last == 0xA9 ||
                           last == 0xAF;
        return space ? 3 : 0;
    }
    if (lead == 0xE2 && mid == 0x81) {
        return last == 0x9F ? 3 : 0;  // U+205F
    }
    if (lead == 0xE3) {
        return (mid == 0x80 && last == 0x80) ? 3 : 0;  // U+3000
    }
    return 0;
}

/// @brief Length of the whitespace code point @p text ends with, or 0.
std::size_t trailingSpaceLength(std::string_view text) noexcept {
    for (std::size_t length = 1; length <= 3 && length <= text.size(); ++length) {
        if (leadingSpaceLength(text.substr(text.size() - length)) == length) {
            return length;
        }
    }
    return 0;
}

}  // namespace

std::string_view trimWhitespace(std::string_view text) noexcept {
    while (const auto length = leadingSpaceLength(text)) {
        text.remove_prefix(length);
    }
    while (const auto length = trailingSpaceLength(text)) {
        text.remove_suffix(length);
    }
    return text;
}

LineBuffer splitLines(ByteView data, bool allowEmptyLines) {
    const std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());

    // Upper bound on the line count, so the vector never reallocates
    LineBuffer lines;
    lines.reserve(static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1);

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        const auto line = trimWhitespace(text.substr(pos, end - pos));
        if (allowEmptyLines || !line.empty()) {
            lines.emplace_back(line);
        }
        pos = end + 1;
    }

    return lines;
}

Result<LineBuffer> fastLoadLines(std::string_view path, bool allowEmptyLines,
                                 bool returnErrorOnEmptyFile, const ReadOptions& options) {
    auto data = parallelRead(path, options);
    if (!data) {
        return std::unexpected(std::move(data.error()));
    }

    LineBuffer lines = splitLines(*data, allowEmptyLines);
    FRW_LOG_DEBUG("Loaded {} line(s) from {}", lines.size(), path);

    if (returnErrorOnEmptyFile && lines.empty()) {
        return makeError(ErrorCode::kFileEmpty, "file empty");
    }
    return lines;
}

}  // namespace frw::io
