#include <cvpipe/parsing/field_extractors.h>
#include <cvpipe/parsing/section_segmenter.h>
#include <cvpipe/parsing/text_utils.h>
#include <cvpipe/parsing/vocabulary.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <sstream>

namespace cvpipe::parsing {

namespace {

const std::regex& emailPattern() {
    static const std::regex re(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})");
    return re;
}

// Tried in order; the first pattern with a match wins
const std::array<std::regex, 3>& phonePatterns() {
    static const std::array<std::regex, 3> patterns{
        std::regex(R"(\+?1?[-.\s]?\(?([0-9]{3})\)?[-.\s]?([0-9]{3})[-.\s]?([0-9]{4}))"),
        std::regex(R"(\+?([0-9]{1,4})[-.\s]?([0-9]{3,4})[-.\s]?([0-9]{3,4})[-.\s]?([0-9]{3,4}))"),
        std::regex(R"(\b\d{3}[-.\s]?\d{3}[-.\s]?\d{4}\b)")};
    return patterns;
}

const std::regex& linkedinPattern() {
    static const std::regex re(R"((?:https?://)?(?:www\.)?linkedin\.com/in/([a-zA-Z0-9-]+)/?)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& githubPattern() {
    static const std::regex re(R"((?:https?://)?(?:www\.)?github\.com/([a-zA-Z0-9-]+)/?)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& urlPattern() {
    static const std::regex re(
        R"((?:https?://|www\.)[A-Za-z0-9.-]+\.[A-Za-z]{2,}(?:/[^\s,;|]*)?)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

// "Springfield, IL 62704" or "Springfield, IL"
const std::regex& addressPattern() {
    static const std::regex re(R"(([A-Za-z][A-Za-z .'-]*),\s*([A-Z]{2})\b\s*(\d{5}(?:-\d{4})?)?)");
    return re;
}

constexpr std::array<std::string_view, 7> kCountries{
    "United States", "United Kingdom", "USA", "Canada", "UK", "Germany", "France"};

bool isDigitAt(std::string_view s, size_t pos) {
    return pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) != 0;
}

std::optional<std::string> findPhone(const std::string& text) {
    for (const auto& pattern : phonePatterns()) {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
             it != std::sregex_iterator(); ++it) {
            auto pos = static_cast<size_t>(it->position());
            auto len = static_cast<size_t>(it->length());
            // Reject matches that are part of a longer digit run
            if ((pos > 0 && isDigitAt(text, pos - 1)) || isDigitAt(text, pos + len)) {
                continue;
            }
            std::string match = trimCopy(it->str());
            if (!match.empty()) {
                return normalizePhone(match);
            }
        }
    }
    return std::nullopt;
}

bool looksLikeUrl(std::string_view line) {
    auto lower = toLower(line);
    return lower.find("http") != std::string::npos || lower.find("www.") != std::string::npos ||
           lower.find(".com") != std::string::npos;
}

// A name line: 2-5 words of letters, no digits, '@' or URL, not a heading
bool looksLikeName(std::string_view line) {
    if (line.empty() || line.size() > 60 || containsDigit(line) ||
        line.find('@') != std::string_view::npos || looksLikeUrl(line) ||
        line.find(':') != std::string_view::npos || line.find('|') != std::string_view::npos ||
        classifyHeading(line)) {
        return false;
    }
    std::istringstream words{std::string(line)};
    std::string word;
    size_t count = 0;
    while (words >> word) {
        if (!std::isalpha(static_cast<unsigned char>(word.front())) &&
            static_cast<unsigned char>(word.front()) < 0x80) {
            return false;
        }
        ++count;
    }
    return count >= 2 && count <= 5;
}

void setIfMissing(std::optional<std::string>& field, std::string value) {
    if (!field && !value.empty()) {
        field = std::move(value);
    }
}

} // namespace

std::string normalizePhone(std::string_view raw) {
    std::string digits;
    for (char c : raw) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    if (digits.size() == 10) {
        return "+1" + digits;
    }
    if (digits.size() == 11 && digits.front() == '1') {
        return "+" + digits;
    }
    return trimCopy(raw);
}

void extractContact(std::string_view text, ContactInfo& contact) {
    const std::string str(text);
    std::smatch m;

    if (!contact.email && std::regex_search(str, m, emailPattern())) {
        contact.email = m.str();
    }

    if (!contact.phone) {
        if (auto phone = findPhone(str)) {
            contact.phone = *phone;
        }
    }

    if (!contact.linkedin && std::regex_search(str, m, linkedinPattern())) {
        contact.linkedin = m.str();
    }
    if (!contact.github && std::regex_search(str, m, githubPattern())) {
        contact.github = m.str();
    }

    if (!contact.website) {
        for (auto it = std::sregex_iterator(str.begin(), str.end(), urlPattern());
             it != std::sregex_iterator(); ++it) {
            auto lower = toLower(it->str());
            if (lower.find("linkedin.com") == std::string::npos &&
                lower.find("github.com") == std::string::npos) {
                contact.website = it->str();
                break;
            }
        }
    }

    auto lines = nonEmptyLines(text);

    if (!contact.name) {
        // Names sit at the top; only the first few lines are considered
        size_t considered = 0;
        for (const auto& line : lines) {
            if (++considered > 5) {
                break;
            }
            if (looksLikeName(line)) {
                contact.name = line;
                break;
            }
        }
    }

    if (!contact.city) {
        for (const auto& line : lines) {
            if (line.size() > 120) {
                continue;
            }
            if (std::regex_search(line, m, addressPattern())) {
                setIfMissing(contact.address, trimCopy(m.str()));
                setIfMissing(contact.city, trimCopy(m[1].str()));
                setIfMissing(contact.state, m[2].str());
                if (m[3].matched) {
                    setIfMissing(contact.postalCode, m[3].str());
                }
                break;
            }
        }
    }

    if (!contact.country) {
        for (auto country : kCountries) {
            if (std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
                    return line.size() <= 80 && containsTerm(line, country);
                })) {
                contact.country = std::string(country);
                break;
            }
        }
    }
}

} // namespace cvpipe::parsing
