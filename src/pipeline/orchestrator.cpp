#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <utility>

#include <cvpipe/core/ids.h>
#include <cvpipe/pipeline/orchestrator.h>
#include <cvpipe/pipeline/scoring.h>

namespace cvpipe::pipeline {

namespace {

using Clock = std::chrono::system_clock;

const char* stageTitle(StageId id) {
    switch (id) {
        case StageId::Extraction:
            return "Extraction";
        case StageId::Parsing:
            return "Parsing";
        case StageId::Enhancement:
            return "Enhancement";
        case StageId::Matching:
            return "Matching";
        case StageId::Validation:
            return "Validation";
    }
    return "Stage";
}

core::StopCondition stopFor(const core::CancellationToken& token, std::chrono::seconds timeout) {
    core::StopCondition stop{token, std::nullopt};
    if (timeout.count() > 0) {
        stop.deadline = std::chrono::steady_clock::now() + timeout;
    }
    return stop;
}

// Runs one stage body and records timing, payload and outcome. The body gets the stop
// condition and returns a Result; exceptions are converted to InternalError.
template <typename Fn>
StageResult runStage(StageId id, const core::StopCondition& stop, std::chrono::seconds timeout,
                     Fn&& body) {
    StageResult stage;
    stage.stage = id;
    stage.status = StageStatus::InProgress;
    stage.startTime = Clock::now();

    std::optional<Error> error;
    try {
        auto outcome = body(stop);
        if (!outcome) {
            error = outcome.error();
        } else if (stop.expired()) {
            error = Error{ErrorCode::Timeout,
                          fmt::format("{} exceeded the {}s stage timeout", stageTitle(id),
                                      timeout.count())};
        } else {
            stage.payload = std::move(outcome).value();
        }
    } catch (const std::exception& e) {
        error = Error{ErrorCode::InternalError, e.what()};
    }

    stage.endTime = Clock::now();
    if (error) {
        stage.status = StageStatus::Failed;
        stage.success = false;
        stage.error = std::move(error);
    } else {
        stage.status = StageStatus::Completed;
        stage.success = true;
    }
    spdlog::debug("Stage {} {} in {}ms", stageName(id), statusName(stage.status),
                  stage.elapsed().count());
    return stage;
}

void skipStage(PipelineResult& result, StageId id, std::string reason = {}) {
    auto& stage = result.stageResults[id];
    stage.stage = id;
    stage.status = StageStatus::Skipped;
    stage.success = false;
    if (!reason.empty()) {
        spdlog::debug("Stage {} skipped: {}", stageName(id), reason);
        result.warnings.push_back(reason);
        stage.warnings.push_back(std::move(reason));
    }
}

bool criticalStagesCompleted(const PipelineResult& result) {
    for (auto id : kStageOrder) {
        if (!isCriticalStage(id)) {
            continue;
        }
        const auto* stage = result.stage(id);
        if (!stage || stage->status != StageStatus::Completed) {
            return false;
        }
    }
    return true;
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(
    PipelineConfig config, std::shared_ptr<const extraction::ExtractionEngine> engine,
    std::shared_ptr<services::IEnhancementService> enhancer,
    std::shared_ptr<services::IMatchingService> matcher)
    : config_(std::move(config)),
      engine_(std::move(engine)),
      enhancer_(std::move(enhancer)),
      matcher_(std::move(matcher)),
      parser_(config_.parsing),
      validator_(Validator::Thresholds{0.5, 100, config_.minConfidenceThreshold}) {}

std::unique_ptr<PipelineOrchestrator>
PipelineOrchestrator::create(PipelineConfig config, const extraction::EngineCapabilities& caps) {
    std::shared_ptr<const extraction::ExtractionEngine> engine =
        extraction::ExtractionEngine::createDefault(caps, config.engine);
    return std::make_unique<PipelineOrchestrator>(std::move(config), std::move(engine),
                                                  std::make_shared<services::HeuristicEnhancer>(),
                                                  std::make_shared<services::KeywordMatcher>());
}

std::unique_ptr<PipelineOrchestrator> PipelineOrchestrator::create(PipelineConfig config) {
    auto caps = extraction::EngineCapabilities::probe(config.extraction);
    return create(std::move(config), caps);
}

PipelineResult PipelineOrchestrator::run(const extraction::Document& document,
                                         core::CancellationToken token) const {
    const auto started = std::chrono::steady_clock::now();

    PipelineResult result;
    result.inputRef = document.displayName();
    result.processingId = core::generateId("cv");
    result.processedAt = core::isoTimestamp(Clock::now());
    for (auto id : kStageOrder) {
        result.stageResults[id].stage = id;
    }

    spdlog::info("Processing {} ({})", result.inputRef, result.processingId);

    bool halted = false;
    for (auto id : kStageOrder) {
        if (halted) {
            skipStage(result, id);
            continue;
        }
        if (token.isCancelled()) {
            result.cancelled = true;
            auto message = fmt::format("Pipeline cancelled before {}", stageName(id));
            // Once the profile exists the run has succeeded; the rest is optional
            if (isCriticalStage(id)) {
                result.errors.push_back(std::move(message));
            } else {
                result.warnings.push_back(std::move(message));
            }
            halted = true;
            skipStage(result, id);
            continue;
        }

        const auto stop = stopFor(token, config_.stageTimeout);
        auto& stage = result.stageResults[id];

        switch (id) {
            case StageId::Extraction:
                stage = runStage(id, stop, config_.stageTimeout, [&](const auto& s) {
                    return engine_->extract(document, config_.extraction, s);
                });
                break;

            case StageId::Parsing: {
                const auto* extracted = result.extraction();
                stage = runStage(id, stop, config_.stageTimeout, [&](const auto&) {
                    return parser_.parse(extracted->text, extracted->confidence);
                });
                break;
            }

            case StageId::Enhancement:
                if (!config_.enableEnhancement) {
                    skipStage(result, id);
                    continue;
                }
                if (!enhancer_) {
                    skipStage(result, id, "Enhancement skipped: no enhancement service");
                    continue;
                }
                stage = runStage(id, stop, config_.stageTimeout, [&](const auto&) {
                    return enhancer_->enhance(*result.profile(), config_.jobDescription);
                });
                break;

            case StageId::Matching:
                if (!config_.enableMatching) {
                    skipStage(result, id);
                    continue;
                }
                if (!matcher_) {
                    skipStage(result, id, "Matching skipped: no matching service");
                    continue;
                }
                if (!config_.jobDescription || config_.jobDescription->empty()) {
                    skipStage(result, id, "Matching skipped: no job description");
                    continue;
                }
                stage = runStage(id, stop, config_.stageTimeout, [&](const auto&) {
                    return matcher_->match(*result.profile(), *config_.jobDescription);
                });
                break;

            case StageId::Validation:
                if (!config_.enableValidation) {
                    skipStage(result, id);
                    continue;
                }
                stage = runStage(id, stop, config_.stageTimeout, [&](const auto&) {
                    return Result<ValidationReport>(
                        validator_.validate(result.extraction(), result.profile()));
                });
                if (const auto* report = std::get_if<ValidationReport>(&stage.payload)) {
                    stage.success = report->passed();
                    stage.warnings = report->warnings;
                    result.warnings.insert(result.warnings.end(), report->warnings.begin(),
                                           report->warnings.end());
                }
                break;
        }

        if (stage.status != StageStatus::Failed) {
            continue;
        }

        const auto& error = *stage.error;
        if (error.code == ErrorCode::OperationCancelled) {
            result.cancelled = true;
        }
        auto message = fmt::format("{} failed: {}", stageTitle(id), error.message);
        if (isCriticalStage(id)) {
            spdlog::error("{}: {}", result.inputRef, message);
            result.errors.push_back(std::move(message));
            halted = true;
        } else {
            spdlog::warn("{}: {}", result.inputRef, message);
            result.warnings.push_back(std::move(message));
        }
    }

    const auto* extracted = result.extraction();
    const auto* profile = result.profile();
    if (extracted && profile) {
        auto scores = computeScores(*extracted, *profile, result.enhancement(), config_.scoring);
        result.confidenceScore = scores.confidence;
        result.qualityScore = scores.quality;
        result.completenessScore = scores.completeness;
    }

    if (!config_.includeRawText) {
        auto& payload = result.stageResults[StageId::Extraction].payload;
        if (auto* ext = std::get_if<extraction::ExtractionResult>(&payload)) {
            ext->text.clear();
        }
    }

    result.overallSuccess = criticalStagesCompleted(result);
    result.totalElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.overallSuccess) {
        spdlog::info("Processed {} in {}ms (confidence {:.2f}, {} warning(s))", result.inputRef,
                     result.totalElapsed.count(), result.confidenceScore, result.warnings.size());
    } else {
        spdlog::warn("Processing {} did not complete ({} error(s))", result.inputRef,
                     result.errors.size());
    }
    return result;
}

PipelineResult PipelineOrchestrator::runFile(const std::filesystem::path& path,
                                             core::CancellationToken token) const {
    auto document = extraction::Document::open(path);
    if (!document) {
        return failedBeforeStart(path.string(), document.error());
    }
    return run(document.value(), std::move(token));
}

PipelineResult PipelineOrchestrator::runText(std::string_view text,
                                             core::CancellationToken token) const {
    return run(extraction::Document::fromString(text), std::move(token));
}

PipelineResult PipelineOrchestrator::failedBeforeStart(std::string inputRef,
                                                       const Error& error) const {
    PipelineResult result;
    result.inputRef = std::move(inputRef);
    result.processingId = core::generateId("cv");
    result.processedAt = core::isoTimestamp(Clock::now());

    auto& extraction = result.stageResults[StageId::Extraction];
    extraction.stage = StageId::Extraction;
    extraction.status = StageStatus::Failed;
    extraction.startTime = extraction.endTime = Clock::now();
    extraction.error = error;
    for (auto id : kStageOrder) {
        if (id != StageId::Extraction) {
            skipStage(result, id);
        }
    }

    result.errors.push_back(fmt::format("Extraction failed: {}", error.message));
    spdlog::error("{}: {}", result.inputRef, result.errors.back());
    return result;
}

} // namespace cvpipe::pipeline
