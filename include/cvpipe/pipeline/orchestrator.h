#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <cvpipe/core/cancellation.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/extraction_engine.h>
#include <cvpipe/parsing/resume_parser.h>
#include <cvpipe/pipeline/pipeline_config.h>
#include <cvpipe/pipeline/pipeline_result.h>
#include <cvpipe/pipeline/validator.h>
#include <cvpipe/services/enhancement_service.h>
#include <cvpipe/services/matching_service.h>

namespace cvpipe::pipeline {

/**
 * @brief Runs Extraction, Parsing, Enhancement, Matching and Validation over one document
 *
 * A run never throws: stage errors and exceptions are recorded in the returned
 * PipelineResult. Extraction and Parsing are critical; a failure there skips every later
 * stage. The remaining stages degrade to warnings.
 *
 * The orchestrator holds only read-only state plus the collaborators, so one instance can
 * serve concurrent runs provided the collaborators are thread-safe (the built-in ones are).
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(PipelineConfig config,
                         std::shared_ptr<const extraction::ExtractionEngine> engine,
                         std::shared_ptr<services::IEnhancementService> enhancer = nullptr,
                         std::shared_ptr<services::IMatchingService> matcher = nullptr);

    /**
     * @brief Orchestrator with the default engine set and the built-in collaborators
     */
    static std::unique_ptr<PipelineOrchestrator> create(PipelineConfig config,
                                                        const extraction::EngineCapabilities& caps);

    /// As above, probing the capabilities from config.extraction
    static std::unique_ptr<PipelineOrchestrator> create(PipelineConfig config);

    PipelineResult run(const extraction::Document& document,
                       core::CancellationToken token = {}) const;

    /// Open a file and run it; open failures become a failed Extraction stage
    PipelineResult runFile(const std::filesystem::path& path,
                           core::CancellationToken token = {}) const;

    /// Run already-extracted text through the pipeline as a plain-text document
    PipelineResult runText(std::string_view text, core::CancellationToken token = {}) const;

    [[nodiscard]] const PipelineConfig& config() const { return config_; }
    [[nodiscard]] const extraction::ExtractionEngine& engine() const { return *engine_; }

private:
    PipelineResult failedBeforeStart(std::string inputRef, const Error& error) const;

    PipelineConfig config_;
    std::shared_ptr<const extraction::ExtractionEngine> engine_;
    std::shared_ptr<services::IEnhancementService> enhancer_;
    std::shared_ptr<services::IMatchingService> matcher_;
    parsing::ResumeParser parser_;
    Validator validator_;
};

} // namespace cvpipe::pipeline
