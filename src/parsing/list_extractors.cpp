#include <cvpipe/parsing/field_extractors.h>
#include <cvpipe/parsing/text_normalizer.h>
#include <cvpipe/parsing/text_utils.h>
#include <cvpipe/parsing/vocabulary.h>

#include <regex>

namespace cvpipe::parsing {

namespace {

constexpr size_t kMinProjectEntry = 30;
constexpr size_t kMinCertificationLine = 10;
constexpr size_t kMinSummaryLine = 20;
constexpr size_t kMinAchievementLine = 10;

// Drop a short "Label:" prefix such as "Languages:" or "Cloud & DevOps:"
std::string stripLabel(const std::string& line) {
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 30) {
        return line;
    }
    auto label = std::string_view(line).substr(0, colon);
    if (label.find(',') != std::string_view::npos) {
        return line;
    }
    // Keep URLs intact
    if (colon + 2 < line.size() && line[colon + 1] == '/' && line[colon + 2] == '/') {
        return line;
    }
    return trimCopy(std::string_view(line).substr(colon + 1));
}

/**
 * Tokenize a list line on bullets, commas, semicolons, pipes and free-standing
 * hyphens. Hyphens inside words ("Scikit-learn") are kept.
 */
std::vector<std::string> splitListItems(std::string_view line) {
    std::string work(line);
    // Bullets become separators wherever they appear
    size_t pos = 0;
    while ((pos = work.find(kBullet, pos)) != std::string::npos) {
        work.replace(pos, kBullet.size(), ",");
    }
    for (std::string_view dash : {" - ", " – ", " — "}) {
        pos = 0;
        while ((pos = work.find(dash, pos)) != std::string::npos) {
            work.replace(pos, dash.size(), ",");
        }
    }
    if (work.rfind("- ", 0) == 0 || work.rfind("* ", 0) == 0) {
        work = work.substr(2);
    }

    std::vector<std::string> items;
    std::string current;
    for (char c : work) {
        if (c == ',' || c == ';' || c == '|') {
            items.push_back(trimCopy(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    items.push_back(trimCopy(current));
    for (auto& item : items) {
        while (!item.empty() && (item.back() == '.' || item.back() == '-')) {
            item.pop_back();
        }
        item = trimCopy(item);
    }
    return items;
}

std::string trimSeparators(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '|' || s.back() == ',' ||
                          s.back() == '-' || s.back() == '(' || s.back() == ')')) {
        s.pop_back();
    }
    return trimCopy(s);
}

std::string removeRange(const std::string& line, const DateRange& range) {
    return trimSeparators(line.substr(0, range.offset) + line.substr(range.offset + range.length));
}

// Line with the matched span cut out
std::string cutMatch(const std::string& line, const std::smatch& m) {
    auto pos = static_cast<size_t>(m.position(0));
    auto len = static_cast<size_t>(m.length(0));
    return trimCopy(line.substr(0, pos) + " " + line.substr(pos + len));
}

const std::regex& urlPattern() {
    static const std::regex re(R"((?:https?://|www\.)[^\s,;|)]+|github\.com/[^\s,;|)]+)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

bool startsWithCaseless(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

} // namespace

std::vector<std::string> extractSkills(std::string_view section) {
    std::vector<std::string> skills;
    for (const auto& line : nonEmptyLines(section)) {
        for (const auto& item : splitListItems(stripLabel(stripBullet(line)))) {
            if (item.size() > 1 && item.size() < 50) {
                pushUniqueCaseless(skills, item);
            }
        }
    }
    for (const auto& term : findVocabularySkills(section)) {
        pushUniqueCaseless(skills, term);
    }
    return skills;
}

std::string extractSummary(std::string_view section) {
    std::string summary;
    for (const auto& line : nonEmptyLines(section)) {
        if (isBulletLine(line) || line.size() <= kMinSummaryLine) {
            continue;
        }
        if (!summary.empty()) {
            summary += ' ';
        }
        summary += line;
    }
    return summary;
}

std::vector<Project> extractProjects(std::string_view section) {
    std::vector<Project> out;
    for (const auto& entry : splitEntries(section)) {
        if (entry.size() < kMinProjectEntry) {
            continue;
        }
        auto lines = nonEmptyLines(entry);
        Project project;

        std::string name = stripBullet(lines.front());
        if (auto range = findDateRange(name)) {
            project.startDate = range->start;
            project.endDate = range->end;
            name = removeRange(name, *range);
        }
        // "Name | Python, Flask" or "Name - short tagline": keep the name part
        for (std::string_view sep : {" | ", " - ", " – "}) {
            auto pos = name.find(sep);
            if (pos != std::string::npos) {
                auto tail = trimCopy(std::string_view(name).substr(pos + sep.size()));
                name = trimCopy(std::string_view(name).substr(0, pos));
                if (!tail.empty()) {
                    project.description.push_back(tail);
                }
                break;
            }
        }
        project.name = name;

        for (size_t i = 1; i < lines.size(); ++i) {
            auto text = stripBullet(lines[i]);
            if (startsWithCaseless(text, "technologies:") || startsWithCaseless(text, "tech stack:") ||
                startsWithCaseless(text, "tech:") || startsWithCaseless(text, "built with:")) {
                for (const auto& item : splitListItems(stripLabel(text))) {
                    if (item.size() > 1 && item.size() < 50) {
                        pushUniqueCaseless(project.technologies, item);
                    }
                }
                continue;
            }
            if (project.startDate.empty()) {
                if (auto range = findDateRange(text)) {
                    project.startDate = range->start;
                    project.endDate = range->end;
                    text = removeRange(text, *range);
                }
            }
            if (!text.empty()) {
                project.description.push_back(text);
            }
        }
        for (const auto& term : findVocabularySkills(entry)) {
            pushUniqueCaseless(project.technologies, term);
        }

        std::smatch m;
        if (std::regex_search(entry, m, urlPattern())) {
            project.url = m.str();
        }

        if (!project.name.empty()) {
            out.push_back(std::move(project));
        }
    }
    return out;
}

std::vector<Certification> extractCertifications(std::string_view section) {
    static const std::regex credentialPattern(R"(credential\s*id[:#\s]*([A-Za-z0-9-]+))",
                                              std::regex::ECMAScript | std::regex::icase);
    static const std::regex monthYear(
        R"(\b(?:jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)[a-z]*\.?\s+(?:19|20)\d{2}\b|\b(?:19|20)\d{2}\b)",
        std::regex::ECMAScript | std::regex::icase);

    std::vector<Certification> out;
    for (const auto& raw : nonEmptyLines(section)) {
        std::string line = stripBullet(raw);
        std::string credentialId;
        std::smatch m;

        if (std::regex_search(line, m, credentialPattern)) {
            credentialId = m[1].str();
            // A credential id on its own line belongs to the previous certification
            if (startsWithCaseless(line, "credential")) {
                if (!out.empty() && out.back().credentialId.empty()) {
                    out.back().credentialId = credentialId;
                }
                continue;
            }
            line = trimSeparators(line.substr(0, static_cast<size_t>(m.position(0))));
        }
        if (line.size() <= kMinCertificationLine) {
            continue;
        }

        Certification cert;
        cert.credentialId = std::move(credentialId);
        if (std::regex_search(line, m, urlPattern())) {
            cert.url = m.str();
            line = cutMatch(line, m);
        }
        if (std::regex_search(line, m, monthYear)) {
            cert.dateIssued = m.str();
            line = cutMatch(line, m);
        }
        line = trimSeparators(line);

        cert.name = line;
        for (std::string_view sep : {" - ", " – ", " by ", ", ", " | "}) {
            auto pos = line.find(sep);
            if (pos != std::string::npos && pos > 0) {
                cert.name = trimSeparators(line.substr(0, pos));
                cert.issuer = trimSeparators(line.substr(pos + sep.size()));
                break;
            }
        }
        if (!cert.name.empty()) {
            out.push_back(std::move(cert));
        }
    }
    return out;
}

std::vector<std::string> extractLanguages(std::string_view section) {
    std::vector<std::string> languages;
    for (const auto& line : nonEmptyLines(section)) {
        for (const auto& item : splitListItems(stripLabel(stripBullet(line)))) {
            if (item.size() > 1) {
                pushUniqueCaseless(languages, item);
            }
        }
    }
    return languages;
}

std::vector<std::string> extractAchievements(std::string_view section) {
    std::vector<std::string> achievements;
    for (const auto& line : nonEmptyLines(section)) {
        if (isBulletLine(line)) {
            auto text = stripBullet(line);
            if (!text.empty()) {
                achievements.push_back(std::move(text));
            }
        } else if (line.size() > kMinAchievementLine) {
            achievements.push_back(line);
        }
    }
    return achievements;
}

} // namespace cvpipe::parsing
