#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <cvpipe/extraction/extraction_engine.h>
#include <cvpipe/extraction/text_extractor.h>
#include <cvpipe/parsing/resume_parser.h>

namespace cvpipe::pipeline {

/**
 * @brief Weights of the pipeline-level scores
 */
struct ScoreWeights {
    // confidenceScore
    double extraction = 0.3;
    double parsing = 0.4;
    double enhancement = 0.3;       // multiplied by the enhancement overall score
    double noEnhancementBase = 0.2; // used when enhancement did not run

    // qualityScore
    double contact = 0.2;
    double experience = 0.3;
    double education = 0.2;
    double skills = 0.2;
    double summary = 0.1;
};

/**
 * @brief Everything a pipeline run needs, built once and passed down read-only
 */
struct PipelineConfig {
    extraction::ExtractionConfig extraction;
    extraction::ExtractionEngine::Options engine;
    parsing::ParsingWeights parsing;
    ScoreWeights scoring;

    bool enableEnhancement = true;
    bool enableMatching = false;
    bool enableValidation = true;

    std::optional<std::string> jobDescription; // target job for enhancement and matching

    double minConfidenceThreshold = 0.3;    // parsing confidence below this warns
    std::chrono::seconds stageTimeout{300}; // 0 disables the per-stage deadline
    bool includeRawText = true;             // keep extracted text in the result

    size_t workers = 0; // batch worker threads; 0 = hardware concurrency
};

} // namespace cvpipe::pipeline
