#include <cvpipe/parsing/field_extractors.h>
#include <cvpipe/parsing/text_utils.h>
#include <cvpipe/parsing/vocabulary.h>

#include <array>
#include <regex>

namespace cvpipe::parsing {

namespace {

constexpr size_t kMinExperienceEntry = 50;
constexpr size_t kMinEducationEntry = 20;

#define CVPIPE_MONTH                                                                               \
    R"(\b(?:jan(?:uary)?|feb(?:ruary)?|mar(?:ch)?|apr(?:il)?|may|june?|july?|aug(?:ust)?|)"           \
    R"(sep(?:t(?:ember)?)?|oct(?:ober)?|nov(?:ember)?|dec(?:ember)?)\.?)"
#define CVPIPE_DASH R"(\s*(?:-|–|—|to)\s*)"

const std::regex& monthRangePattern() {
    static const std::regex re("(" CVPIPE_MONTH R"(\s+\d{4}))" CVPIPE_DASH
                               "(" CVPIPE_MONTH R"(\s+\d{4}|present|current|now))",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& yearRangePattern() {
    static const std::regex re(R"(\b((?:19|20)\d{2}))" CVPIPE_DASH
                               R"(((?:19|20)\d{2}|present|current|now)\b)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

#undef CVPIPE_MONTH
#undef CVPIPE_DASH

const std::regex& gpaPattern() {
    static const std::regex re(R"(GPA[:\s]*([0-9]+(?:\.[0-9]+)?)(?:\s*/\s*[0-9.]+)?)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

// "City, ST", "City, Country" or "Remote" on its own line
const std::regex& locationPattern() {
    static const std::regex re(R"(^(?:[A-Z][A-Za-z .'-]*,\s*[A-Z][A-Za-z .]*|Remote|Hybrid)$)");
    return re;
}

constexpr std::array<std::string_view, 12> kDegreeMarkers{
    "bachelor", "master", "b.s", "b.a", "m.s", "m.a", "ph.d", "phd", "mba", "associate",
    "doctor",   "b.sc"};

bool looksLikeDegree(std::string_view line) {
    auto lower = toLower(line);
    for (auto marker : kDegreeMarkers) {
        if (lower.rfind(marker, 0) == 0) {
            return true;
        }
    }
    return false;
}

std::string trimSeparators(std::string s) {
    auto isSep = [](char c) {
        return c == ' ' || c == ',' || c == '|' || c == '-' || c == '(' || c == ')' || c == ';';
    };
    while (!s.empty() && isSep(s.back())) {
        s.pop_back();
    }
    size_t start = 0;
    while (start < s.size() && isSep(s[start])) {
        ++start;
    }
    s = s.substr(start);
    // Dangling en/em dash left after removing a date range
    for (std::string_view dash : {"–", "—"}) {
        while (s.size() >= dash.size() && s.compare(s.size() - dash.size(), dash.size(), dash) == 0) {
            s.erase(s.size() - dash.size());
            s = trimCopy(s);
        }
    }
    return trimCopy(s);
}

std::string removeSpan(const std::string& line, size_t offset, size_t length) {
    return trimSeparators(line.substr(0, offset) + " " + line.substr(offset + length));
}

// Split "left<delim>right" on the first occurrence of delim
bool splitOn(const std::string& s, std::string_view delim, std::string& left, std::string& right) {
    auto pos = s.find(delim);
    if (pos == std::string::npos) {
        return false;
    }
    left = trimSeparators(s.substr(0, pos));
    right = trimSeparators(s.substr(pos + delim.size()));
    return !left.empty() && !right.empty();
}

void parseExperienceHeader(const std::string& header, WorkExperience& exp) {
    std::string left;
    std::string right;
    if (splitOn(header, " at ", left, right)) {
        exp.position = left;
        exp.company = right;
    } else if (splitOn(header, " - ", left, right) || splitOn(header, " – ", left, right) ||
               splitOn(header, " — ", left, right)) {
        exp.company = left;
        exp.position = right;
    } else if (splitOn(header, "|", left, right)) {
        exp.position = left;
        exp.company = right;
    } else {
        exp.company = header;
    }
}

} // namespace

std::optional<DateRange> findDateRange(std::string_view line) {
    const std::string str(line);
    std::smatch m;
    if (std::regex_search(str, m, monthRangePattern()) ||
        std::regex_search(str, m, yearRangePattern())) {
        DateRange range;
        range.start = trimCopy(m[1].str());
        range.end = trimCopy(m[2].str());
        range.offset = static_cast<size_t>(m.position(0));
        range.length = static_cast<size_t>(m.length(0));
        return range;
    }
    return std::nullopt;
}

std::optional<int> findYear(std::string_view text) {
    static const std::regex re(R"(\b(?:19|20)\d{2}\b)");
    const std::string str(text);
    std::smatch m;
    if (std::regex_search(str, m, re)) {
        return std::stoi(m.str());
    }
    return std::nullopt;
}

std::vector<WorkExperience> extractExperience(std::string_view section) {
    std::vector<WorkExperience> out;
    for (const auto& entry : splitEntries(section)) {
        if (entry.size() < kMinExperienceEntry) {
            continue;
        }

        auto lines = nonEmptyLines(entry);
        WorkExperience exp;
        bool haveDates = false;
        size_t bodyStart = 1;

        std::string header = stripBullet(lines.front());
        if (auto range = findDateRange(header)) {
            exp.startDate = range->start;
            exp.endDate = range->end;
            haveDates = true;
            header = removeSpan(header, range->offset, range->length);
        }
        if (header.empty() && lines.size() > 1) {
            header = stripBullet(lines[1]);
            bodyStart = 2;
        }
        parseExperienceHeader(header, exp);

        for (size_t i = bodyStart; i < lines.size(); ++i) {
            const std::string& line = lines[i];
            if (auto range = findDateRange(line)) {
                if (!haveDates) {
                    exp.startDate = range->start;
                    exp.endDate = range->end;
                    haveDates = true;
                }
                std::string rest = removeSpan(line, range->offset, range->length);
                if (rest.empty()) {
                    continue;
                }
                if (i == bodyStart && exp.location.empty() &&
                    std::regex_match(rest, locationPattern())) {
                    exp.location = rest;
                    continue;
                }
                exp.description.push_back(stripBullet(rest));
                continue;
            }
            if (i == bodyStart && !isBulletLine(line) && line.size() <= 40 &&
                std::regex_match(line, locationPattern())) {
                exp.location = line;
                continue;
            }
            auto text = stripBullet(line);
            if (!text.empty()) {
                exp.description.push_back(std::move(text));
            }
        }

        exp.technologies = findVocabularySkills(entry);

        if (!exp.company.empty() || !exp.position.empty()) {
            out.push_back(std::move(exp));
        }
    }
    return out;
}

std::vector<Education> extractEducation(std::string_view section) {
    std::vector<Education> out;
    for (const auto& entry : splitEntries(section)) {
        if (entry.size() < kMinEducationEntry) {
            continue;
        }

        auto lines = nonEmptyLines(entry);
        Education edu;

        auto parseDegreeLine = [&edu](std::string line) {
            if (auto range = findDateRange(line)) {
                line = removeSpan(line, range->offset, range->length);
            }
            std::string degree;
            std::string rest;
            std::string institution;
            if (splitOn(line, " at ", degree, institution)) {
                edu.institution = institution;
                line = degree;
            } else if (splitOn(line, ", ", degree, rest) && !looksLikeDegree(rest)) {
                // "<degree>, <institution>[, <year>]"
                static const std::regex yearToken(R"(\b(?:19|20)\d{2}\b)");
                rest = trimSeparators(std::regex_replace(rest, yearToken, ""));
                if (!rest.empty() && !containsDigit(rest)) {
                    edu.institution = rest;
                }
                line = degree;
            }
            std::string field;
            if (splitOn(line, " in ", degree, field)) {
                edu.degree = degree;
                edu.fieldOfStudy = trimSeparators(field);
            } else {
                edu.degree = trimSeparators(line);
            }
        };

        std::string header = stripBullet(lines.front());
        size_t bodyStart = 1;
        bool headerHasDegree = looksLikeDegree(header) || header.find(" in ") != std::string::npos;
        if (headerHasDegree) {
            parseDegreeLine(header);
        } else {
            std::string inst = header;
            if (auto range = findDateRange(inst)) {
                inst = removeSpan(inst, range->offset, range->length);
            }
            edu.institution = trimSeparators(inst);
            if (lines.size() > 1 && (looksLikeDegree(lines[1]) ||
                                     lines[1].find(" in ") != std::string::npos)) {
                std::string headerInstitution = edu.institution;
                parseDegreeLine(stripBullet(lines[1]));
                if (!headerInstitution.empty()) {
                    edu.institution = headerInstitution;
                }
                bodyStart = 2;
            }
        }
        // Institution only after the degree line: "B.S. in CS\nMIT"
        if (edu.institution.empty() && lines.size() > bodyStart &&
            !findDateRange(lines[bodyStart]) && !isBulletLine(lines[bodyStart]) &&
            toLower(lines[bodyStart]).rfind("gpa", 0) != 0) {
            edu.institution = trimSeparators(lines[bodyStart]);
        }

        if (auto range = findDateRange(entry)) {
            edu.startDate = range->start;
            edu.endDate = range->end;
        } else if (auto year = findYear(entry)) {
            edu.endDate = std::to_string(*year);
        }

        std::smatch m;
        if (std::regex_search(entry, m, gpaPattern())) {
            edu.gpa = m[1].str();
        }

        for (const auto& line : lines) {
            auto lower = toLower(line);
            auto listAfterColon = [&line]() {
                std::vector<std::string> items;
                auto colon = line.find(':');
                std::string rest = line.substr(colon + 1);
                size_t start = 0;
                while (start <= rest.size()) {
                    auto comma = rest.find(',', start);
                    auto item = trimSeparators(rest.substr(
                        start, comma == std::string::npos ? std::string::npos : comma - start));
                    if (!item.empty()) {
                        items.push_back(item);
                    }
                    if (comma == std::string::npos) {
                        break;
                    }
                    start = comma + 1;
                }
                return items;
            };
            if (lower.rfind("honors:", 0) == 0 || lower.rfind("honours:", 0) == 0) {
                edu.honors = listAfterColon();
            } else if (lower.rfind("relevant coursework:", 0) == 0 ||
                       lower.rfind("coursework:", 0) == 0) {
                edu.coursework = listAfterColon();
            }
        }

        if (!edu.institution.empty() || !edu.degree.empty()) {
            out.push_back(std::move(edu));
        }
    }
    return out;
}

} // namespace cvpipe::parsing
