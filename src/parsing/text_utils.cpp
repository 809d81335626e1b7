#include <cvpipe/parsing/text_normalizer.h>
#include <cvpipe/parsing/text_utils.h>

#include <algorithm>
#include <cctype>

namespace cvpipe::parsing {

namespace {
constexpr std::string_view kSpaces = " \t\r\n\f\v";
}

std::string trimCopy(std::string_view s) {
    auto first = s.find_first_not_of(kSpaces);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(kSpaces);
    return std::string(s.substr(first, last - first + 1));
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::vector<std::string> nonEmptyLines(std::string_view text) {
    std::vector<std::string> out;
    for (const auto& line : splitLines(text)) {
        auto t = trimCopy(line);
        if (!t.empty()) {
            out.push_back(std::move(t));
        }
    }
    return out;
}

std::vector<std::string> splitEntries(std::string_view text) {
    std::vector<std::string> entries;
    std::string current;
    for (const auto& line : splitLines(text)) {
        auto t = trimCopy(line);
        if (t.empty()) {
            if (!current.empty()) {
                entries.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        if (!current.empty()) {
            current += '\n';
        }
        current += t;
    }
    if (!current.empty()) {
        entries.push_back(std::move(current));
    }
    return entries;
}

bool isBulletLine(std::string_view line) {
    auto t = trimCopy(line);
    if (t.rfind(kBullet, 0) == 0) {
        return true;
    }
    return t.size() >= 2 && (t[0] == '-' || t[0] == '*') && t[1] == ' ';
}

std::string stripBullet(std::string_view line) {
    auto t = trimCopy(line);
    if (t.rfind(kBullet, 0) == 0) {
        return trimCopy(std::string_view(t).substr(kBullet.size()));
    }
    if (t.size() >= 2 && (t[0] == '-' || t[0] == '*') && t[1] == ' ') {
        return trimCopy(std::string_view(t).substr(2));
    }
    return t;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool pushUniqueCaseless(std::vector<std::string>& out, const std::string& value) {
    if (std::any_of(out.begin(), out.end(),
                    [&](const std::string& existing) { return iequals(existing, value); })) {
        return false;
    }
    out.push_back(value);
    return true;
}

bool containsDigit(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace cvpipe::parsing
