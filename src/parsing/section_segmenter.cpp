#include <cvpipe/parsing/section_segmenter.h>
#include <cvpipe/parsing/text_utils.h>

#include <algorithm>
#include <array>
#include <utility>

namespace cvpipe::parsing {

namespace {

struct HeadingVariant {
    SectionType type;
    std::string_view text;
};

// clang-format off
constexpr std::array kHeadingVariants{
    HeadingVariant{SectionType::Contact, "contact"},
    HeadingVariant{SectionType::Contact, "contact information"},
    HeadingVariant{SectionType::Contact, "contact info"},
    HeadingVariant{SectionType::Contact, "personal information"},
    HeadingVariant{SectionType::Contact, "personal details"},
    HeadingVariant{SectionType::Contact, "contact details"},

    HeadingVariant{SectionType::Summary, "summary"},
    HeadingVariant{SectionType::Summary, "profile"},
    HeadingVariant{SectionType::Summary, "objective"},
    HeadingVariant{SectionType::Summary, "professional summary"},
    HeadingVariant{SectionType::Summary, "career objective"},
    HeadingVariant{SectionType::Summary, "career summary"},
    HeadingVariant{SectionType::Summary, "professional profile"},
    HeadingVariant{SectionType::Summary, "about me"},

    HeadingVariant{SectionType::Experience, "experience"},
    HeadingVariant{SectionType::Experience, "work experience"},
    HeadingVariant{SectionType::Experience, "professional experience"},
    HeadingVariant{SectionType::Experience, "employment"},
    HeadingVariant{SectionType::Experience, "employment history"},
    HeadingVariant{SectionType::Experience, "career history"},
    HeadingVariant{SectionType::Experience, "work history"},
    HeadingVariant{SectionType::Experience, "relevant experience"},

    HeadingVariant{SectionType::Education, "education"},
    HeadingVariant{SectionType::Education, "academic background"},
    HeadingVariant{SectionType::Education, "educational background"},
    HeadingVariant{SectionType::Education, "qualifications"},
    HeadingVariant{SectionType::Education, "academic qualifications"},
    HeadingVariant{SectionType::Education, "education and training"},

    HeadingVariant{SectionType::Skills, "skills"},
    HeadingVariant{SectionType::Skills, "technical skills"},
    HeadingVariant{SectionType::Skills, "core competencies"},
    HeadingVariant{SectionType::Skills, "key skills"},
    HeadingVariant{SectionType::Skills, "competencies"},
    HeadingVariant{SectionType::Skills, "technologies"},
    HeadingVariant{SectionType::Skills, "skills and technologies"},

    HeadingVariant{SectionType::Projects, "projects"},
    HeadingVariant{SectionType::Projects, "key projects"},
    HeadingVariant{SectionType::Projects, "notable projects"},
    HeadingVariant{SectionType::Projects, "personal projects"},
    HeadingVariant{SectionType::Projects, "academic projects"},

    HeadingVariant{SectionType::Certifications, "certifications"},
    HeadingVariant{SectionType::Certifications, "certificates"},
    HeadingVariant{SectionType::Certifications, "professional certifications"},
    HeadingVariant{SectionType::Certifications, "licenses"},
    HeadingVariant{SectionType::Certifications, "licenses and certifications"},
    HeadingVariant{SectionType::Certifications, "credentials"},

    HeadingVariant{SectionType::Languages, "languages"},
    HeadingVariant{SectionType::Languages, "language skills"},
    HeadingVariant{SectionType::Languages, "linguistic skills"},

    HeadingVariant{SectionType::Achievements, "achievements"},
    HeadingVariant{SectionType::Achievements, "accomplishments"},
    HeadingVariant{SectionType::Achievements, "awards"},
    HeadingVariant{SectionType::Achievements, "honors"},
    HeadingVariant{SectionType::Achievements, "honors and awards"},
    HeadingVariant{SectionType::Achievements, "awards and honors"},
    HeadingVariant{SectionType::Achievements, "recognition"},
};
// clang-format on

// Heading text with trailing ':', '-', '|' and surrounding whitespace removed,
// inner whitespace collapsed, lowercased, '&' spelled out
std::string headingKey(std::string_view line) {
    std::string t = trimCopy(line);
    while (!t.empty() && (t.back() == ':' || t.back() == '-' || t.back() == '|')) {
        t.pop_back();
        t = trimCopy(t);
    }
    std::string key;
    bool space = false;
    for (char c : toLower(t)) {
        if (c == ' ' || c == '\t') {
            space = !key.empty();
            continue;
        }
        if (space) {
            key.push_back(' ');
            space = false;
        }
        if (c == '&') {
            key += "and";
            continue;
        }
        key.push_back(c);
    }
    return key;
}

} // namespace

const char* sectionName(SectionType type) {
    switch (type) {
        case SectionType::Contact:
            return "contact";
        case SectionType::Summary:
            return "summary";
        case SectionType::Experience:
            return "experience";
        case SectionType::Education:
            return "education";
        case SectionType::Skills:
            return "skills";
        case SectionType::Projects:
            return "projects";
        case SectionType::Certifications:
            return "certifications";
        case SectionType::Languages:
            return "languages";
        case SectionType::Achievements:
            return "achievements";
    }
    return "unknown";
}

std::optional<SectionType> sectionFromName(std::string_view name) {
    for (auto type : kAllSections) {
        if (iequals(name, sectionName(type))) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<SectionType> classifyHeading(std::string_view line) {
    if (line.size() > 60) {
        return std::nullopt;
    }
    auto key = headingKey(line);
    if (key.empty()) {
        return std::nullopt;
    }

    std::optional<SectionType> best;
    size_t bestLen = 0;
    for (const auto& variant : kHeadingVariants) {
        if (key == variant.text && variant.text.size() > bestLen) {
            best = variant.type;
            bestLen = variant.text.size();
        }
    }
    return best;
}

std::vector<HeadingOccurrence> findHeadings(std::string_view text) {
    std::vector<HeadingOccurrence> found;
    size_t offset = 0;
    while (offset <= text.size()) {
        auto nl = text.find('\n', offset);
        size_t lineEnd = nl == std::string_view::npos ? text.size() : nl;
        auto line = text.substr(offset, lineEnd - offset);
        if (auto type = classifyHeading(line)) {
            HeadingOccurrence occ;
            occ.type = *type;
            occ.offset = offset;
            occ.bodyStart = nl == std::string_view::npos ? text.size() : nl + 1;
            occ.heading = trimCopy(line);
            found.push_back(std::move(occ));
        }
        if (nl == std::string_view::npos) {
            break;
        }
        offset = nl + 1;
    }

    // Lines are scanned in order, so offsets are already ascending
    for (size_t i = 0; i < found.size(); ++i) {
        found[i].bodyEnd = i + 1 < found.size() ? found[i + 1].offset : text.size();
    }
    return found;
}

std::map<SectionType, std::string> segment(std::string_view text) {
    std::map<SectionType, std::string> sections;
    for (const auto& occ : findHeadings(text)) {
        if (sections.count(occ.type)) {
            continue;
        }
        auto body = text.substr(occ.bodyStart, occ.bodyEnd - occ.bodyStart);
        sections.emplace(occ.type, trimCopy(body));
    }
    return sections;
}

} // namespace cvpipe::parsing
