#pragma once

#include <cvpipe/extraction/text_extractor.h>
#include <cvpipe/parsing/profile.h>
#include <cvpipe/pipeline/pipeline_result.h>

namespace cvpipe::pipeline {

/**
 * @brief Quality checks over the extraction and parsing outputs
 *
 * Never fails a run; every finding is a warning.
 */
class Validator {
public:
    struct Thresholds {
        double minExtractionConfidence = 0.5;
        size_t minTextLength = 100;
        double minParsingConfidence = 0.3;
    };

    Validator() = default;
    explicit Validator(Thresholds thresholds) : thresholds_(thresholds) {}

    /**
     * @param extraction Extraction output, or nullptr when extraction did not succeed
     * @param profile Parsed profile, or nullptr when parsing did not succeed
     */
    ValidationReport validate(const extraction::ExtractionResult* extraction,
                              const parsing::CandidateProfile* profile) const;

private:
    Thresholds thresholds_;
};

} // namespace cvpipe::pipeline
