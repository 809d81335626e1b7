#include <spdlog/spdlog.h>
#include <cvpipe/parsing/field_extractors.h>
#include <cvpipe/parsing/text_utils.h>
#include <cvpipe/parsing/vocabulary.h>
#include <cvpipe/services/enhancement_service.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <set>

namespace cvpipe::services {

using parsing::CandidateProfile;

namespace {

constexpr std::array<std::string_view, 5> kLeadershipWords{"led", "managed", "directed",
                                                           "supervised", "coordinated"};
constexpr std::array<std::string_view, 6> kOutdatedTech{"flash", "silverlight",
                                                        "internet explorer", "vb6", "perl",
                                                        "cobol"};

std::string descriptionText(const CandidateProfile& profile) {
    std::string text;
    for (const auto& exp : profile.experience) {
        for (const auto& line : exp.description) {
            text += line;
            text += ' ';
        }
    }
    return parsing::toLower(text);
}

std::string profileText(const CandidateProfile& profile) {
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
    return parsing::toLower(text);
}

bool anyWord(const std::string& lowerText, std::initializer_list<std::string_view> words) {
    return std::any_of(words.begin(), words.end(),
                       [&](std::string_view w) { return parsing::containsTerm(lowerText, w); });
}

bool hasSkill(const std::vector<std::string>& lowerSkills,
              std::initializer_list<std::string_view> names) {
    return std::any_of(names.begin(), names.end(), [&](std::string_view n) {
        return std::find(lowerSkills.begin(), lowerSkills.end(), n) != lowerSkills.end();
    });
}

size_t skillCategoryCount(const std::vector<std::string>& skills) {
    size_t count = 0;
    for (const auto& [category, terms] : parsing::skillCategories()) {
        bool found = std::any_of(skills.begin(), skills.end(), [&](const std::string& s) {
            return std::any_of(terms.begin(), terms.end(),
                               [&](std::string_view t) { return parsing::iequals(s, t); });
        });
        if (found) {
            ++count;
        }
    }
    return count;
}

} // namespace

int HeuristicEnhancer::currentYear() const {
    if (referenceYear_ > 0) {
        return referenceYear_;
    }
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    return tm.tm_year + 1900;
}

Result<EnhancementReport> HeuristicEnhancer::enhance(const CandidateProfile& profile,
                                                     const std::optional<std::string>& targetJob) {
    EnhancementReport report;
    report.overallScore = resumeScore(profile);
    report.strengths = strengths(profile);
    report.weaknesses = weaknesses(profile);
    report.suggestions = suggestions(profile);
    report.missingKeywords = missingKeywords(profile, targetJob);
    report.atsCompatibility = atsCompatibility(profile);
    report.estimatedExperienceLevel = experienceLevel(profile);
    report.suitableRoles = suitableRoles(profile);
    report.skillGaps = skillGaps(profile);

    spdlog::debug("Heuristic assessment: score {:.2f}, ATS {:.2f}, level {}", report.overallScore,
                  report.atsCompatibility, report.estimatedExperienceLevel);
    return report;
}

double HeuristicEnhancer::resumeScore(const CandidateProfile& profile) const {
    double score = 0.0;

    double contact = 0.0;
    contact += profile.contact.name ? 0.3 : 0.0;
    contact += profile.contact.email ? 0.3 : 0.0;
    contact += profile.contact.phone ? 0.2 : 0.0;
    contact += profile.contact.linkedin ? 0.2 : 0.0;
    score += contact * 0.2;

    if (!profile.experience.empty()) {
        double exp = std::min(static_cast<double>(profile.experience.size()) * 0.3, 1.0);
        size_t totalDescription = 0;
        for (const auto& e : profile.experience) {
            for (const auto& line : e.description) {
                totalDescription += line.size() + 1;
            }
        }
        if (static_cast<double>(totalDescription) /
                static_cast<double>(profile.experience.size()) >
            100.0) {
            exp += 0.2;
        }
        score += std::min(exp, 1.0) * 0.3;
    }

    if (!profile.education.empty()) {
        score += std::min(static_cast<double>(profile.education.size()) * 0.5, 1.0) * 0.15;
    }

    if (!profile.skills.empty()) {
        score += std::min(static_cast<double>(profile.skills.size()) * 0.1, 1.0) * 0.2;
    }

    if (profile.summary.size() > 50) {
        score += 0.1;
    }

    double bonus = 0.0;
    bonus += profile.projects.empty() ? 0.0 : 0.02;
    bonus += profile.certifications.empty() ? 0.0 : 0.02;
    bonus += profile.achievements.empty() ? 0.0 : 0.01;
    score += std::min(bonus, 0.05);

    return clampScore(score);
}

double HeuristicEnhancer::atsCompatibility(const CandidateProfile& profile) const {
    double score = 0.0;
    if (profile.contact.email && profile.contact.email->find('@') != std::string::npos) {
        score += 0.15;
    }
    if (profile.contact.phone) {
        score += 0.15;
    }
    score += static_cast<double>(profile.sectionsFound.size()) /
             static_cast<double>(parsing::kAllSections.size()) * 0.2;
    if (!profile.skills.empty()) {
        score += 0.2;
    }
    if (!profile.experience.empty()) {
        auto dated = std::count_if(profile.experience.begin(), profile.experience.end(),
                                   [](const parsing::WorkExperience& e) {
                                       return !e.startDate.empty() || !e.endDate.empty();
                                   });
        score += static_cast<double>(dated) / static_cast<double>(profile.experience.size()) * 0.2;
    }
    if (!profile.education.empty()) {
        score += 0.1;
    }
    return clampScore(score);
}

std::string HeuristicEnhancer::experienceLevel(const CandidateProfile& profile) const {
    if (profile.experience.empty()) {
        return "Entry Level";
    }

    int totalYears = 0;
    for (const auto& exp : profile.experience) {
        if (exp.startDate.empty() || exp.endDate.empty()) {
            continue;
        }
        auto start = parsing::findYear(exp.startDate);
        if (!start) {
            continue;
        }
        auto endLower = parsing::toLower(exp.endDate);
        std::optional<int> end;
        if (endLower == "present" || endLower == "current" || endLower == "now") {
            end = currentYear();
        } else {
            end = parsing::findYear(exp.endDate);
        }
        if (end) {
            totalYears += std::max(0, *end - *start);
        }
    }

    if (totalYears == 0) {
        if (profile.experience.size() >= 4) {
            return "Senior Level";
        }
        return profile.experience.size() >= 2 ? "Mid Level" : "Entry Level";
    }
    if (totalYears >= 8) {
        return "Senior Level";
    }
    return totalYears >= 3 ? "Mid Level" : "Entry Level";
}

std::vector<std::string> HeuristicEnhancer::strengths(const CandidateProfile& profile) const {
    std::vector<std::string> out;
    if (profile.experience.size() >= 3) {
        out.emplace_back("Strong work experience with multiple roles");
    }
    if (std::any_of(profile.education.begin(), profile.education.end(),
                    [](const parsing::Education& e) {
                        auto d = parsing::toLower(e.degree);
                        return d.find("master") != std::string::npos ||
                               d.find("phd") != std::string::npos ||
                               d.find("ph.d") != std::string::npos;
                    })) {
        out.emplace_back("Advanced degree demonstrates commitment to learning");
    }
    if (profile.skills.size() >= 10) {
        out.emplace_back("Comprehensive technical skills");
    }
    if (!profile.certifications.empty()) {
        out.emplace_back("Professional certifications validate expertise");
    }
    if (!profile.projects.empty()) {
        out.emplace_back("Personal/side projects show initiative and passion");
    }
    if (profile.contact.linkedin && profile.contact.github) {
        out.emplace_back("Strong online professional presence");
    }
    auto described = descriptionText(profile);
    if (std::any_of(kLeadershipWords.begin(), kLeadershipWords.end(),
                    [&](std::string_view w) { return parsing::containsTerm(described, w); })) {
        out.emplace_back("Demonstrates leadership experience");
    }
    return out;
}

std::vector<std::string> HeuristicEnhancer::weaknesses(const CandidateProfile& profile) const {
    std::vector<std::string> out;
    if (!profile.contact.email) {
        out.emplace_back("Missing email contact information");
    }
    if (!profile.contact.phone) {
        out.emplace_back("Missing phone contact information");
    }
    if (profile.summary.size() < 50) {
        out.emplace_back("Missing or insufficient professional summary");
    }
    if (profile.experience.size() < 2) {
        out.emplace_back("Limited work experience");
    }
    if (profile.education.empty()) {
        out.emplace_back("No education information provided");
    }
    if (profile.skills.size() < 5) {
        out.emplace_back("Limited technical skills listed");
    }

    std::string outdated;
    for (const auto& skill : profile.skills) {
        auto lower = parsing::toLower(skill);
        if (std::find(kOutdatedTech.begin(), kOutdatedTech.end(), lower) != kOutdatedTech.end()) {
            if (!outdated.empty()) {
                outdated += ", ";
            }
            outdated += skill;
        }
    }
    if (!outdated.empty()) {
        out.push_back("Some outdated technologies: " + outdated);
    }
    return out;
}

std::vector<std::string> HeuristicEnhancer::suggestions(const CandidateProfile& profile) const {
    std::vector<std::string> out;
    if (profile.summary.empty()) {
        out.emplace_back(
            "Add a compelling professional summary highlighting your key achievements");
    }
    if (!profile.contact.linkedin) {
        out.emplace_back("Include your LinkedIn profile URL");
    }
    for (const auto& exp : profile.experience) {
        if (exp.description.size() < 2) {
            const std::string& role = exp.position.empty() ? exp.company : exp.position;
            out.push_back("Add more detailed description for " + role + " role");
        }
    }
    if (profile.projects.empty()) {
        out.emplace_back("Consider adding relevant projects to showcase your skills");
    }
    if (profile.certifications.empty()) {
        out.emplace_back("Consider adding professional certifications relevant to your field");
    }
    if (skillCategoryCount(profile.skills) < 3) {
        out.emplace_back("Diversify your skill set across different technology categories");
    }
    return out;
}

std::vector<std::string> HeuristicEnhancer::suitableRoles(const CandidateProfile& profile) const {
    std::string skillsText;
    for (const auto& s : profile.skills) {
        skillsText += parsing::toLower(s) + ' ';
    }

    std::vector<std::string> roles;
    if (anyWord(skillsText, {"python", "java", "javascript", "programming"})) {
        roles.emplace_back("Software Developer");
    }
    if (anyWord(skillsText, {"react", "angular", "html", "css"})) {
        roles.emplace_back("Frontend Developer");
    }
    if (anyWord(skillsText, {"node.js", "django", "flask", "api"})) {
        roles.emplace_back("Backend Developer");
    }
    if (anyWord(skillsText, {"machine learning", "data science", "pandas", "tensorflow"})) {
        roles.emplace_back("Data Scientist");
    }
    if (anyWord(skillsText, {"aws", "docker", "kubernetes", "devops"})) {
        roles.emplace_back("DevOps Engineer");
    }
    if (anyWord(descriptionText(profile), {"managed", "led", "directed", "supervised"})) {
        roles.emplace_back("Technical Lead");
        roles.emplace_back("Engineering Manager");
    }
    if (roles.size() > 5) {
        roles.resize(5);
    }
    return roles;
}

std::vector<std::string> HeuristicEnhancer::skillGaps(const CandidateProfile& profile) const {
    std::vector<std::string> lowerSkills;
    for (const auto& s : profile.skills) {
        lowerSkills.push_back(parsing::toLower(s));
    }

    std::vector<std::string> gaps;
    if (!hasSkill(lowerSkills, {"docker", "kubernetes", "containerization"})) {
        gaps.emplace_back("Container technologies (Docker, Kubernetes)");
    }
    if (!hasSkill(lowerSkills, {"aws", "azure", "gcp", "cloud"})) {
        gaps.emplace_back("Cloud platforms (AWS, Azure, GCP)");
    }
    if (!hasSkill(lowerSkills, {"git", "version control"})) {
        gaps.emplace_back("Version control systems");
    }
    if (!hasSkill(lowerSkills, {"agile", "scrum"})) {
        gaps.emplace_back("Agile methodologies");
    }
    if (!hasSkill(lowerSkills, {"testing", "unit testing", "tdd"})) {
        gaps.emplace_back("Testing frameworks and methodologies");
    }
    return gaps;
}

std::vector<std::string>
HeuristicEnhancer::missingKeywords(const CandidateProfile& profile,
                                   const std::optional<std::string>& targetJob) const {
    const std::string text = profileText(profile);
    std::vector<std::string> missing;

    // Industries the profile already touches suggest their missing keywords
    for (const auto& [industry, keywords] : parsing::industryKeywords()) {
        std::vector<std::string> absent;
        bool anyFound = false;
        for (auto kw : keywords) {
            if (parsing::containsTerm(text, kw)) {
                anyFound = true;
            } else {
                absent.emplace_back(kw);
            }
        }
        if (anyFound) {
            for (size_t i = 0; i < absent.size() && i < 3; ++i) {
                missing.push_back(absent[i]);
            }
        }
    }

    if (targetJob) {
        for (const auto& skill : parsing::findVocabularySkills(*targetJob)) {
            bool have = std::any_of(profile.skills.begin(), profile.skills.end(),
                                    [&](const std::string& s) { return parsing::iequals(s, skill); });
            if (!have) {
                parsing::pushUniqueCaseless(missing, skill);
            }
        }
    }

    if (missing.size() > 10) {
        missing.resize(10);
    }
    return missing;
}

} // namespace cvpipe::services
