#include <spdlog/spdlog.h>
#include <cvpipe/parsing/field_extractors.h>
#include <cvpipe/parsing/resume_parser.h>
#include <cvpipe/parsing/section_segmenter.h>
#include <cvpipe/parsing/text_normalizer.h>
#include <cvpipe/parsing/vocabulary.h>

namespace cvpipe::parsing {

double contactCompleteness(const ContactInfo& contact) {
    int present = 0;
    present += contact.name ? 1 : 0;
    present += contact.email ? 1 : 0;
    present += contact.phone ? 1 : 0;
    return present / 3.0;
}

Result<CandidateProfile> ResumeParser::parse(std::string_view text,
                                             double extractionConfidence) const {
    const std::string normalized = normalize(text);
    if (normalized.empty()) {
        return Error{ErrorCode::ParsingFailed, "No text to parse"};
    }

    auto sections = segment(normalized);

    CandidateProfile profile;
    for (const auto& [type, body] : sections) {
        profile.sectionsFound.insert(type);
    }
    fillSections(sections, normalized, profile);
    profile.parsingConfidence = confidence(profile, extractionConfidence);

    spdlog::debug("Parsed profile: {} sections, {} jobs, {} schools, {} skills, confidence {:.2f}",
                  profile.sectionsFound.size(), profile.experience.size(),
                  profile.education.size(), profile.skills.size(), profile.parsingConfidence);
    return profile;
}

void ResumeParser::fillSections(const std::map<SectionType, std::string>& sections,
                                std::string_view fullText, CandidateProfile& profile) const {
    auto body = [&sections](SectionType type) -> std::string_view {
        auto it = sections.find(type);
        return it != sections.end() ? std::string_view(it->second) : std::string_view{};
    };

    // Contact section first, then the text before the first heading, then everything
    if (sections.count(SectionType::Contact)) {
        extractContact(body(SectionType::Contact), profile.contact);
    }
    auto headings = findHeadings(fullText);
    std::string_view preamble =
        headings.empty() ? fullText : fullText.substr(0, headings.front().offset);
    extractContact(preamble, profile.contact);
    extractContact(fullText, profile.contact);

    if (sections.count(SectionType::Summary)) {
        profile.summary = extractSummary(body(SectionType::Summary));
    }
    if (sections.count(SectionType::Experience)) {
        profile.experience = extractExperience(body(SectionType::Experience));
    }
    if (sections.count(SectionType::Education)) {
        profile.education = extractEducation(body(SectionType::Education));
    }
    if (sections.count(SectionType::Skills)) {
        profile.skills = extractSkills(body(SectionType::Skills));
    } else {
        profile.skills = findVocabularySkills(fullText);
    }
    if (sections.count(SectionType::Projects)) {
        profile.projects = extractProjects(body(SectionType::Projects));
    }
    if (sections.count(SectionType::Certifications)) {
        profile.certifications = extractCertifications(body(SectionType::Certifications));
    }
    if (sections.count(SectionType::Languages)) {
        profile.languages = extractLanguages(body(SectionType::Languages));
    }
    if (sections.count(SectionType::Achievements)) {
        profile.achievements = extractAchievements(body(SectionType::Achievements));
    }
}

double ResumeParser::confidence(const CandidateProfile& profile,
                                double extractionConfidence) const {
    double score = clampScore(extractionConfidence) * weights_.extraction;
    score += contactCompleteness(profile.contact) * weights_.contact;
    score += static_cast<double>(profile.sectionsFound.size()) /
             static_cast<double>(kAllSections.size()) * weights_.sections;

    double content = 0.0;
    if (!profile.experience.empty()) {
        content += weights_.experienceContent;
    }
    if (!profile.education.empty()) {
        content += weights_.educationContent;
    }
    if (!profile.skills.empty()) {
        content += weights_.skillsContent;
    }
    if (!profile.summary.empty()) {
        content += weights_.summaryContent;
    }
    score += content * weights_.content;

    return clampScore(score);
}

} // namespace cvpipe::parsing
