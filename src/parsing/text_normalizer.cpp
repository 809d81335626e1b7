#include <cvpipe/core/utf8.h>
#include <cvpipe/parsing/text_normalizer.h>
#include <cvpipe/parsing/text_utils.h>

#include <regex>
#include <utility>
#include <vector>

namespace cvpipe::parsing {

namespace {

bool isBulletGlyph(char32_t cp) {
    switch (cp) {
        case 0x2022: // •
        case 0x00B7: // ·
        case 0x25AA: // ▪
        case 0x25AB: // ▫
        case 0x25E6: // ◦
        case 0x2023: // ‣
        case 0x2043: // ⁃
        case 0x25CF: // ●
        case 0x25A0: // ■
        case 0x25BA: // ►
        case 0x27A2: // ➢
        case 0x2219: // ∙
        case 0xF0B7: // Symbol-font bullet from PDF private use area
        case 0xF0A7:
            return true;
        default:
            return false;
    }
}

bool isDroppedControl(char32_t cp) {
    if (cp == '\n' || cp == '\t') {
        return false;
    }
    return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F) ||
           (cp >= 0x200B && cp <= 0x200D) || cp == 0xFEFF;
}

const std::vector<std::pair<std::regex, std::string>>& ocrRepairs() {
    static const std::vector<std::pair<std::regex, std::string>> repairs = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        std::vector<std::pair<std::regex, std::string>> v;
        v.emplace_back(std::regex(R"(\bEducat[1l]0n\b)", flags), "Education");
        v.emplace_back(std::regex(R"(\bExper[1l]ence\b)", flags), "Experience");
        v.emplace_back(std::regex(R"(\bSk[1l]{3}s\b)", flags), "Skills");
        v.emplace_back(std::regex(R"(\bPr0jects\b)", flags), "Projects");
        v.emplace_back(std::regex(R"(\bCertificat[1l]0ns\b)", flags), "Certifications");
        v.emplace_back(std::regex(R"(\b0f\b)", std::regex::ECMAScript), "of");
        return v;
    }();
    return repairs;
}

// Collapse runs of spaces into one and trim both ends
std::string collapseSpaces(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    bool pendingSpace = false;
    for (char c : line) {
        if (c == ' ') {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string normalize(std::string_view text) {
    // Pass 1: code point level cleanup
    std::string cleaned;
    cleaned.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = core::decodeUtf8(text, pos);
        if (cp == '\r') {
            if (pos < text.size() && text[pos] == '\n') {
                ++pos;
            }
            cleaned.push_back('\n');
        } else if (cp == '\n') {
            cleaned.push_back('\n');
        } else if (core::isUnicodeSpace(cp)) {
            cleaned.push_back(' ');
        } else if (isDroppedControl(cp)) {
            continue;
        } else if (isBulletGlyph(cp)) {
            cleaned.append(kBullet);
        } else {
            core::appendUtf8(cleaned, cp);
        }
    }

    // Pass 2: per line whitespace and OCR repairs, blank line runs collapsed
    std::string out;
    out.reserve(cleaned.size());
    bool pendingBlank = false;
    for (const auto& raw : splitLines(cleaned)) {
        std::string line = collapseSpaces(raw);
        if (line.empty()) {
            pendingBlank = !out.empty();
            continue;
        }
        for (const auto& [pattern, replacement] : ocrRepairs()) {
            line = std::regex_replace(line, pattern, replacement);
        }
        if (!out.empty()) {
            out += pendingBlank ? "\n\n" : "\n";
        }
        pendingBlank = false;
        out += line;
    }
    return out;
}

} // namespace cvpipe::parsing
