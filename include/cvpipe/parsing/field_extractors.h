#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cvpipe/parsing/profile.h>

namespace cvpipe::parsing {

/**
 * @brief A start/end date pair found in a line
 *
 * Month-name ranges ("Jan 2020 - Present") and bare-year ranges ("2016 - 2020") are
 * recognized. Numeric MM/DD/YYYY ranges are not.
 */
struct DateRange {
    std::string start;
    std::string end;
    size_t offset = 0; // position of the match in the searched line
    size_t length = 0;
};

std::optional<DateRange> findDateRange(std::string_view line);

/// First four-digit year in 19xx/20xx, if any
std::optional<int> findYear(std::string_view text);

/**
 * @brief Fill missing contact fields from text; fields already set are kept
 */
void extractContact(std::string_view text, ContactInfo& contact);

/// Normalize a phone match: 10 digits gain "+1", 11 digits starting with 1 gain "+"
std::string normalizePhone(std::string_view raw);

std::vector<WorkExperience> extractExperience(std::string_view section);
std::vector<Education> extractEducation(std::string_view section);

/**
 * @brief Skills listed in a section, unioned with vocabulary terms found in it
 */
std::vector<std::string> extractSkills(std::string_view section);

std::string extractSummary(std::string_view section);
std::vector<Project> extractProjects(std::string_view section);
std::vector<Certification> extractCertifications(std::string_view section);
std::vector<std::string> extractLanguages(std::string_view section);
std::vector<std::string> extractAchievements(std::string_view section);

} // namespace cvpipe::parsing
