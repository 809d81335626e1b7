#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cvpipe::parsing {

std::string trimCopy(std::string_view s);
std::string toLower(std::string_view s);

/// Split on '\n', keeping empty lines
std::vector<std::string> splitLines(std::string_view text);

/// Trimmed non-empty lines
std::vector<std::string> nonEmptyLines(std::string_view text);

/// Blank-line separated blocks, each trimmed; empty blocks dropped
std::vector<std::string> splitEntries(std::string_view text);

/// True when the line starts with a bullet glyph or a "- " / "* " marker
bool isBulletLine(std::string_view line);

/// Line without its leading bullet marker, trimmed
std::string stripBullet(std::string_view line);

/// Case-insensitive equality for ASCII text
bool iequals(std::string_view a, std::string_view b);

/// Appends `value` unless an entry equal to it ignoring ASCII case is present
bool pushUniqueCaseless(std::vector<std::string>& out, const std::string& value);

bool containsDigit(std::string_view s);

} // namespace cvpipe::parsing
