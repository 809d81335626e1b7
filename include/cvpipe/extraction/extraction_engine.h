#pragma once

#include <map>
#include <memory>
#include <utility>

#include <cvpipe/core/cancellation.h>
#include <cvpipe/extraction/confidence.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/method_selector.h>
#include <cvpipe/extraction/text_extractor.h>

namespace cvpipe::extraction {

/**
 * @brief Selects an engine for a document, runs it, and falls back on poor output
 *
 * Attempts are strictly sequential. Engine failures are recorded in the result's
 * attempt log and never escape as exceptions. Registered extractors are stateless, so
 * one engine may serve several pipeline runs concurrently once set up.
 */
class ExtractionEngine {
public:
    struct Options {
        ConfidenceWeights weights;
        FallbackPolicy fallback;
        SelectionThresholds thresholds;
    };

    ExtractionEngine(EngineCapabilities caps, Options options);
    explicit ExtractionEngine(EngineCapabilities caps) : ExtractionEngine(std::move(caps), {}) {}

    /**
     * @brief Engine with the built-in extractors for every available engine
     */
    static std::unique_ptr<ExtractionEngine> createDefault(EngineCapabilities caps,
                                                           Options options = {});

    /**
     * @brief Install or replace the extractor for an engine id
     */
    void registerExtractor(std::unique_ptr<ITextExtractor> extractor);

    /**
     * @brief Extract text from a document
     * @return Best result over the primary attempt and any fallbacks, or an error
     *         listing every engine failure
     */
    Result<ExtractionResult> extract(const Document& document, const ExtractionConfig& config,
                                     const core::StopCondition& stop = {}) const;

    [[nodiscard]] const EngineCapabilities& capabilities() const { return caps_; }
    [[nodiscard]] const Options& options() const { return options_; }

private:
    Result<ExtractionResult> attempt(EngineId id, const Document& document,
                                     const ExtractionConfig& config,
                                     const core::StopCondition& stop) const;

    Result<EngineId> choosePrimary(const Document& document,
                                   const ExtractionConfig& config) const;

    EngineCapabilities caps_;
    Options options_;
    std::map<EngineId, std::unique_ptr<ITextExtractor>> extractors_;
};

} // namespace cvpipe::extraction
