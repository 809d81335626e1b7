#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include <cvpipe/core/types.h>
#include <cvpipe/extraction/text_extractor.h>
#include <cvpipe/parsing/profile.h>
#include <cvpipe/pipeline/pipeline_result.h>

namespace cvpipe::io {

using json = nlohmann::json;

/**
 * @brief JSON view of a profile; absent contact fields are omitted
 *
 * Contains no timing data, so two parses of the same text serialize identically.
 */
json toJson(const parsing::CandidateProfile& profile);

json toJson(const extraction::ExtractionResult& extraction);
json toJson(const services::EnhancementReport& report);
json toJson(const services::MatchReport& report);

/**
 * @brief Full pipeline result including per-stage status and timing
 */
json toJson(const pipeline::PipelineResult& result);

/**
 * @brief Rebuild a profile from toJson output
 * @return Profile, or InvalidData when the document has the wrong shape
 */
Result<parsing::CandidateProfile> profileFromJson(const json& j);

/// Pretty-printed text; invalid UTF-8 in strings is replaced with U+FFFD
std::string dumpJson(const json& j);

/// Pretty-printed write; parent directories must exist
Result<void> writeJsonFile(const std::filesystem::path& path, const json& j);

} // namespace cvpipe::io
