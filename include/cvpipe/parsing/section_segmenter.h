#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cvpipe/parsing/profile.h>

namespace cvpipe::parsing {

/**
 * @brief A heading line recognized in the text
 */
struct HeadingOccurrence {
    SectionType type;
    size_t offset = 0;      // byte offset of the heading line
    size_t bodyStart = 0;   // first byte after the heading line
    size_t bodyEnd = 0;     // offset of the next heading, or end of text
    std::string heading;    // heading text as written
};

/**
 * @brief Find every heading line, ordered by offset, with body spans filled in
 */
std::vector<HeadingOccurrence> findHeadings(std::string_view text);

/**
 * @brief Classify a single line as a section heading
 * @return The section type when the whole line (minus a trailing ':', '-' or '|') is a
 *         heading variant; the longest matching variant wins
 */
std::optional<SectionType> classifyHeading(std::string_view line);

/**
 * @brief Split text into sections keyed by type
 *
 * Each body runs from just after its heading line to the next heading. When a type
 * appears more than once the first occurrence is kept; later duplicates still end
 * the preceding section.
 */
std::map<SectionType, std::string> segment(std::string_view text);

} // namespace cvpipe::parsing
