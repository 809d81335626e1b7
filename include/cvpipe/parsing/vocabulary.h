#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cvpipe::parsing {

/// Curated skill terms recognized anywhere in a résumé, in canonical spelling
const std::vector<std::string_view>& skillVocabulary();

/// Skill terms grouped by domain ("programming", "web_development", ...)
const std::vector<std::pair<std::string_view, std::vector<std::string_view>>>& skillCategories();

/// Industry keyword groups ("technology", "data", "management")
const std::vector<std::pair<std::string_view, std::vector<std::string_view>>>& industryKeywords();

/**
 * @brief Case-insensitive search for a term at word boundaries
 *
 * A boundary is any character that is not an ASCII letter or digit, so "C++" matches in
 * "C++, Go" and "AI" does not match inside "email".
 */
bool containsTerm(std::string_view text, std::string_view term);

/**
 * @brief Terms from `terms` found in `text`, in list order, canonical spelling
 */
std::vector<std::string> findTerms(std::string_view text,
                                   const std::vector<std::string_view>& terms);

/// findTerms() over skillVocabulary()
std::vector<std::string> findVocabularySkills(std::string_view text);

} // namespace cvpipe::parsing
