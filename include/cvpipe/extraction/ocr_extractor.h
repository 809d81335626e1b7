#pragma once

#include <string>
#include <vector>
#include <cvpipe/extraction/text_extractor.h>

namespace cvpipe::extraction {

/**
 * @brief OCR extractor: renders pages with poppler and recognizes them with Tesseract
 *
 * Recognition is gated process-wide so concurrent documents never run more
 * Tesseract instances than there are hardware threads.
 */
class OcrExtractor : public ITextExtractor {
public:
    Result<ExtractionResult> extract(const Document& document, const ExtractionConfig& config,
                                     const core::StopCondition& stop) override;

    EngineId id() const override { return EngineId::Ocr; }

    /**
     * @brief True when Tesseract initializes with the given languages
     */
    static bool isAvailable(const std::vector<std::string>& languages);

    /// Languages joined the way Tesseract expects them, e.g. "eng+deu"
    static std::string joinLanguages(const std::vector<std::string>& languages);
};

} // namespace cvpipe::extraction
