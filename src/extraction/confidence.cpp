#include <cvpipe/core/utf8.h>
#include <cvpipe/extraction/confidence.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace cvpipe::extraction {

namespace {

constexpr std::array<std::string_view, 10> kResumeKeywords{
    "experience", "education", "skills", "work",     "university",
    "degree",     "phone",     "email",  "address", "linkedin"};

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

size_t trimmedLength(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) {
        return 0;
    }
    auto last = text.find_last_not_of(" \t\r\n\f\v");
    return last - first + 1;
}

} // namespace

double specialCharRatio(std::string_view text) {
    size_t total = 0;
    size_t special = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = core::decodeUtf8(text, pos);
        ++total;
        if (!core::isUnicodeAlnum(cp) && !core::isUnicodeSpace(cp)) {
            ++special;
        }
    }
    return total == 0 ? 0.0 : static_cast<double>(special) / static_cast<double>(total);
}

double scoreConfidence(std::string_view text, EngineId engine, const ConfidenceWeights& weights) {
    if (text.empty() || isBlank(text)) {
        return 0.0;
    }

    double score = weights.baseFor(engine);

    if (text.size() > weights.shortLength) {
        score += weights.lengthBonus;
    }
    if (text.size() > weights.longLength) {
        score += weights.lengthBonus;
    }

    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    double keywordScore = 0.0;
    for (auto kw : kResumeKeywords) {
        if (lower.find(kw) != std::string::npos) {
            keywordScore += weights.keywordBonus;
        }
    }
    score += std::min(keywordScore, weights.keywordBonusCap);

    double ratio = specialCharRatio(text);
    if (ratio > weights.specialCharThreshold) {
        score -= (ratio - weights.specialCharThreshold) * weights.specialCharPenalty;
    }

    return clampScore(score);
}

bool needsFallback(const ExtractionResult& result, const FallbackPolicy& policy) {
    if (trimmedLength(result.text) < policy.minTextLength) {
        return true;
    }
    if (result.confidence < policy.minConfidence) {
        return true;
    }
    if (static_cast<double>(result.errors.size()) >
        static_cast<double>(result.pageCount) * policy.maxErrorsPerPage) {
        return true;
    }
    return specialCharRatio(result.text) > policy.maxSpecialCharRatio;
}

} // namespace cvpipe::extraction
