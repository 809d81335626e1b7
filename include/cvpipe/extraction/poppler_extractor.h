#pragma once

#include <cvpipe/extraction/text_extractor.h>

namespace poppler {
class document;
}

namespace cvpipe::extraction {

/**
 * @brief PDF text extractor using poppler-cpp in physical layout mode
 */
class PopplerExtractor : public ITextExtractor {
public:
    Result<ExtractionResult> extract(const Document& document, const ExtractionConfig& config,
                                     const core::StopCondition& stop) override;

    EngineId id() const override { return EngineId::Poppler; }

private:
    void extractMetadata(const poppler::document& doc, ExtractionResult& result);
};

} // namespace cvpipe::extraction
