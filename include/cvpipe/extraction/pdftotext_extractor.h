#pragma once

#include <filesystem>
#include <string>
#include <cvpipe/extraction/text_extractor.h>

namespace cvpipe::extraction {

/**
 * @brief PDF text extractor running the poppler-utils `pdftotext` executable
 *
 * Documents without a backing file are spooled to a temporary file first.
 */
class PdftotextExtractor : public ITextExtractor {
public:
    Result<ExtractionResult> extract(const Document& document, const ExtractionConfig& config,
                                     const core::StopCondition& stop) override;

    EngineId id() const override { return EngineId::Pdftotext; }

    /**
     * @brief True when the executable resolves through the shell
     */
    static bool isAvailable(const std::string& executable = "pdftotext");

private:
    Result<std::string> runCommand(const std::string& command);
};

/// Quote an argument for POSIX sh
std::string shellQuote(const std::string& arg);

} // namespace cvpipe::extraction
