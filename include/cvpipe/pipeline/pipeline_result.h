#pragma once

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <cvpipe/core/types.h>
#include <cvpipe/extraction/text_extractor.h>
#include <cvpipe/parsing/profile.h>
#include <cvpipe/services/enhancement_service.h>
#include <cvpipe/services/matching_service.h>

namespace cvpipe::pipeline {

enum class StageId { Extraction, Parsing, Enhancement, Matching, Validation };

enum class StageStatus { Pending, InProgress, Completed, Failed, Skipped };

inline constexpr std::array<StageId, 5> kStageOrder{StageId::Extraction, StageId::Parsing,
                                                    StageId::Enhancement, StageId::Matching,
                                                    StageId::Validation};

const char* stageName(StageId id);
const char* statusName(StageStatus status);

/// Extraction and Parsing abort the run when they fail
constexpr bool isCriticalStage(StageId id) {
    return id == StageId::Extraction || id == StageId::Parsing;
}

/**
 * @brief Findings of the Validation stage
 */
struct ValidationReport {
    std::vector<std::string> warnings;

    [[nodiscard]] bool passed() const { return warnings.empty(); }
    bool operator==(const ValidationReport&) const = default;
};

using StagePayload =
    std::variant<std::monostate, extraction::ExtractionResult, parsing::CandidateProfile,
                 services::EnhancementReport, services::MatchReport, ValidationReport>;

struct StageResult {
    StageId stage = StageId::Extraction;
    StageStatus status = StageStatus::Pending;
    TimePoint startTime{};
    TimePoint endTime{};
    bool success = false;
    std::optional<Error> error;
    std::vector<std::string> warnings;
    StagePayload payload;

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);
    }
};

/**
 * @brief Outcome of one pipeline run; immutable once returned
 *
 * Every stage of kStageOrder has an entry in stageResults.
 */
struct PipelineResult {
    std::string inputRef;
    std::string processingId;
    std::string processedAt; // ISO 8601 UTC
    std::map<StageId, StageResult> stageResults;

    bool overallSuccess = false;
    bool cancelled = false;
    double confidenceScore = 0.0;
    double qualityScore = 0.0;
    double completenessScore = 0.0;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::chrono::milliseconds totalElapsed{0};

    const extraction::ExtractionResult* extraction() const {
        return payloadOf<extraction::ExtractionResult>(StageId::Extraction);
    }
    const parsing::CandidateProfile* profile() const {
        return payloadOf<parsing::CandidateProfile>(StageId::Parsing);
    }
    const services::EnhancementReport* enhancement() const {
        return payloadOf<services::EnhancementReport>(StageId::Enhancement);
    }
    const services::MatchReport* match() const {
        return payloadOf<services::MatchReport>(StageId::Matching);
    }
    const ValidationReport* validation() const {
        return payloadOf<ValidationReport>(StageId::Validation);
    }

    const StageResult* stage(StageId id) const {
        auto it = stageResults.find(id);
        return it != stageResults.end() ? &it->second : nullptr;
    }

private:
    template <typename T> const T* payloadOf(StageId id) const {
        auto it = stageResults.find(id);
        return it != stageResults.end() ? std::get_if<T>(&it->second.payload) : nullptr;
    }
};

} // namespace cvpipe::pipeline
