#pragma once

#include <string>
#include <string_view>

namespace cvpipe::parsing {

/**
 * @brief Clean extracted text while keeping its line structure
 *
 * - drops control characters other than newline and tab; CRLF/CR become LF
 * - collapses horizontal whitespace (including NBSP) to one space and trims each line
 * - collapses runs of blank lines to a single blank line; trims leading/trailing blanks
 * - repairs common OCR misreads of résumé headings ("Exper1ence", "Sk111s", ...)
 * - unifies bullet glyphs to U+2022
 *
 * normalize(normalize(x)) == normalize(x) for every input.
 */
std::string normalize(std::string_view text);

/// Bullet glyph every bullet variant is mapped to
inline constexpr std::string_view kBullet = "\xE2\x80\xA2";

} // namespace cvpipe::parsing
