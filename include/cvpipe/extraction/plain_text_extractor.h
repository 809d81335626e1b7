#pragma once

#include <span>
#include <cvpipe/extraction/text_extractor.h>

namespace cvpipe::extraction {

/**
 * @brief Extractor for plain text résumés (.txt, .md)
 *
 * Strips a UTF-8 byte order mark and rejects buffers that look binary.
 */
class PlainTextExtractor : public ITextExtractor {
public:
    Result<ExtractionResult> extract(const Document& document, const ExtractionConfig& config,
                                     const core::StopCondition& stop) override;

    EngineId id() const override { return EngineId::PlainText; }

private:
    /**
     * @brief Check if data is likely binary
     */
    bool isBinaryData(std::span<const std::byte> data) const;
};

} // namespace cvpipe::extraction
