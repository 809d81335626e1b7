#include <spdlog/spdlog.h>
#include <cvpipe/parsing/text_utils.h>
#include <cvpipe/parsing/vocabulary.h>
#include <cvpipe/services/matching_service.h>

#include <cctype>
#include <set>
#include <sstream>

namespace cvpipe::services {

namespace {

std::set<std::string> wordSet(std::string_view text) {
    std::set<std::string> words;
    std::istringstream in{parsing::toLower(text)};
    std::string word;
    while (in >> word) {
        // Trim surrounding punctuation, keep inner symbols ("c++", "node.js")
        size_t b = 0;
        size_t e = word.size();
        while (b < e && std::ispunct(static_cast<unsigned char>(word[b]))) {
            ++b;
        }
        while (e > b && std::ispunct(static_cast<unsigned char>(word[e - 1])) &&
               word[e - 1] != '+' && word[e - 1] != '#') {
            --e;
        }
        if (e > b) {
            words.insert(word.substr(b, e - b));
        }
    }
    return words;
}

std::string profileText(const parsing::CandidateProfile& profile) {
    std::string text = profile.summary + ' ';
    for (const auto& exp : profile.experience) {
        text += exp.position + ' ';
        for (const auto& line : exp.description) {
            text += line + ' ';
        }
    }
    for (const auto& skill : profile.skills) {
        text += skill + ' ';
    }
    return text;
}

} // namespace

Result<MatchReport> KeywordMatcher::match(const parsing::CandidateProfile& profile,
                                          std::string_view jobText) {
    if (parsing::trimCopy(jobText).empty()) {
        return Error{ErrorCode::MatchingFailed, "Job description is empty"};
    }

    MatchReport report;

    // Job skills: every taxonomy term named in the job description
    std::vector<std::string> jobSkills;
    for (const auto& [category, terms] : parsing::skillCategories()) {
        for (const auto& term : parsing::findTerms(jobText, terms)) {
            parsing::pushUniqueCaseless(jobSkills, term);
        }
    }
    for (const auto& skill : jobSkills) {
        bool have = false;
        for (const auto& own : profile.skills) {
            if (parsing::iequals(own, skill)) {
                have = true;
                break;
            }
        }
        (have ? report.matchedSkills : report.missingSkills).push_back(skill);
    }
    report.skillMatch = jobSkills.empty() ? 0.0
                                          : static_cast<double>(report.matchedSkills.size()) /
                                                static_cast<double>(jobSkills.size());

    auto jobWords = wordSet(jobText);
    auto resumeWords = wordSet(profileText(profile));
    size_t common = 0;
    for (const auto& w : jobWords) {
        common += resumeWords.count(w);
    }
    report.keywordMatch = jobWords.empty() ? 0.0
                                           : static_cast<double>(common) /
                                                 static_cast<double>(jobWords.size());

    report.overallMatch = clampScore(report.skillMatch * weights_.skill +
                                     report.keywordMatch * weights_.keyword + weights_.base);

    spdlog::debug("Job match: overall {:.2f}, skills {}/{}", report.overallMatch,
                  report.matchedSkills.size(), jobSkills.size());
    return report;
}

} // namespace cvpipe::services
