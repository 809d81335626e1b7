#include <cvpipe/parsing/resume_parser.h>
#include <cvpipe/pipeline/scoring.h>

namespace cvpipe::pipeline {

double qualityScore(const parsing::CandidateProfile& profile, const ScoreWeights& weights) {
    double score = parsing::contactCompleteness(profile.contact) * weights.contact;
    score += profile.experience.empty() ? 0.0 : weights.experience;
    score += profile.education.empty() ? 0.0 : weights.education;
    score += profile.skills.empty() ? 0.0 : weights.skills;
    score += profile.summary.empty() ? 0.0 : weights.summary;
    return clampScore(score);
}

double completenessScore(const parsing::CandidateProfile& profile) {
    return clampScore(static_cast<double>(profile.sectionsFound.size()) /
                      static_cast<double>(parsing::kAllSections.size()));
}

Scores computeScores(const extraction::ExtractionResult& extraction,
                     const parsing::CandidateProfile& profile,
                     const services::EnhancementReport* enhancement, const ScoreWeights& weights) {
    Scores scores;
    double confidence = extraction.confidence * weights.extraction +
                        profile.parsingConfidence * weights.parsing;
    if (enhancement) {
        confidence += enhancement->overallScore * weights.enhancement;
    } else {
        confidence += weights.noEnhancementBase;
    }
    scores.confidence = clampScore(confidence);
    scores.quality = qualityScore(profile, weights);
    scores.completeness = completenessScore(profile);
    return scores;
}

} // namespace cvpipe::pipeline
