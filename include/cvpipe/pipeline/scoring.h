#pragma once

#include <cvpipe/extraction/text_extractor.h>
#include <cvpipe/parsing/profile.h>
#include <cvpipe/pipeline/pipeline_config.h>
#include <cvpipe/services/enhancement_service.h>

namespace cvpipe::pipeline {

struct Scores {
    double confidence = 0.0;
    double quality = 0.0;
    double completeness = 0.0;
};

/**
 * @brief Pipeline-level scores; all clamped to [0,1]
 * @param enhancement Enhancement report, or nullptr when enhancement did not run
 */
Scores computeScores(const extraction::ExtractionResult& extraction,
                     const parsing::CandidateProfile& profile,
                     const services::EnhancementReport* enhancement,
                     const ScoreWeights& weights = {});

double qualityScore(const parsing::CandidateProfile& profile, const ScoreWeights& weights = {});

/// Share of the canonical section types that were found
double completenessScore(const parsing::CandidateProfile& profile);

} // namespace cvpipe::pipeline
