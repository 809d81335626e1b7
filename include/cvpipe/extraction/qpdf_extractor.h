#pragma once

#include <string>
#include <cvpipe/extraction/text_extractor.h>

// Forward declarations for QPDF
class QPDF;
class QPDFPageObjectHelper;

namespace cvpipe::extraction {

/**
 * @brief Fast PDF text extractor reading content-stream text operators with QPDF
 *
 * Works best with simple text PDFs using standard encodings. Composite (CID) fonts
 * produce noisy output, which the confidence score penalizes so another engine is tried.
 */
class QpdfExtractor : public ITextExtractor {
public:
    QpdfExtractor() = default;
    ~QpdfExtractor() override = default;

    Result<ExtractionResult> extract(const Document& document, const ExtractionConfig& config,
                                     const core::StopCondition& stop) override;

    EngineId id() const override { return EngineId::Qpdf; }

private:
    /**
     * @brief Extract metadata from the document information dictionary
     */
    void extractMetadata(QPDF& pdf, ExtractionResult& result);

    /**
     * @brief Extract text from a single page
     */
    std::string extractPageText(QPDFPageObjectHelper& page);
};

} // namespace cvpipe::extraction
