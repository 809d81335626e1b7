#pragma once

#include <map>
#include <string_view>

#include <cvpipe/extraction/text_extractor.h>

namespace cvpipe::extraction {

/**
 * @brief Weights used to estimate the quality of extracted text
 */
struct ConfidenceWeights {
    std::map<EngineId, double> engineBase{{EngineId::Poppler, 0.90},
                                          {EngineId::Pdftotext, 0.85},
                                          {EngineId::Qpdf, 0.80},
                                          {EngineId::Ocr, 0.70},
                                          {EngineId::PlainText, 0.90}};
    double defaultBase = 0.5;

    size_t shortLength = 100; // bonus once text is longer than this
    size_t longLength = 500;  // second bonus once text is longer than this
    double lengthBonus = 0.1;

    double keywordBonus = 0.05; // per distinct résumé keyword found
    double keywordBonusCap = 0.2;

    double specialCharThreshold = 0.2; // ratio above which the penalty applies
    double specialCharPenalty = 2.0;   // multiplier of the excess ratio

    [[nodiscard]] double baseFor(EngineId id) const {
        auto it = engineBase.find(id);
        return it != engineBase.end() ? it->second : defaultBase;
    }
};

/**
 * @brief Thresholds deciding whether an extraction result warrants trying other engines
 */
struct FallbackPolicy {
    size_t minTextLength = 50;
    double minConfidence = 0.5;
    double maxErrorsPerPage = 0.3;
    double maxSpecialCharRatio = 0.3;
};

/**
 * @brief Fraction of code points that are neither alphanumeric nor whitespace
 */
double specialCharRatio(std::string_view text);

/**
 * @brief Score extracted text in [0,1]; blank text scores 0
 */
double scoreConfidence(std::string_view text, EngineId engine,
                       const ConfidenceWeights& weights = {});

/**
 * @brief True when the result is poor enough to try another engine
 */
bool needsFallback(const ExtractionResult& result, const FallbackPolicy& policy = {});

} // namespace cvpipe::extraction
