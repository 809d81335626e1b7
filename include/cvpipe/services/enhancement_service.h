#pragma once

#include <optional>
#include <string>
#include <vector>

#include <cvpipe/core/types.h>
#include <cvpipe/parsing/profile.h>

namespace cvpipe::services {

/**
 * @brief Assessment of a candidate profile
 */
struct EnhancementReport {
    double overallScore = 0.0;     // [0,1]
    double atsCompatibility = 0.0; // [0,1]
    std::string estimatedExperienceLevel;
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    std::vector<std::string> suggestions;
    std::vector<std::string> suitableRoles;
    std::vector<std::string> skillGaps;
    std::vector<std::string> missingKeywords;

    bool operator==(const EnhancementReport&) const = default;
};

/**
 * @brief Enrichment collaborator consumed by the pipeline's Enhancement stage
 *
 * Implementations must be safe to call from several pipeline runs at once.
 */
class IEnhancementService {
public:
    virtual ~IEnhancementService() = default;

    /**
     * @brief Assess a profile, optionally against a target job description
     * @return Report, or EnhancementFailed
     */
    virtual Result<EnhancementReport> enhance(const parsing::CandidateProfile& profile,
                                              const std::optional<std::string>& targetJob) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Deterministic rule-based assessment
 *
 * Scores completeness and content of the profile, estimates seniority from dated
 * experience, and suggests roles and skill gaps from a fixed skill taxonomy.
 */
class HeuristicEnhancer : public IEnhancementService {
public:
    /// Year used for open-ended ranges ("Present"); 0 means the current year
    explicit HeuristicEnhancer(int referenceYear = 0) : referenceYear_(referenceYear) {}

    Result<EnhancementReport> enhance(const parsing::CandidateProfile& profile,
                                      const std::optional<std::string>& targetJob) override;

    std::string name() const override { return "heuristic"; }

    double resumeScore(const parsing::CandidateProfile& profile) const;
    double atsCompatibility(const parsing::CandidateProfile& profile) const;
    std::string experienceLevel(const parsing::CandidateProfile& profile) const;

private:
    std::vector<std::string> strengths(const parsing::CandidateProfile& profile) const;
    std::vector<std::string> weaknesses(const parsing::CandidateProfile& profile) const;
    std::vector<std::string> suggestions(const parsing::CandidateProfile& profile) const;
    std::vector<std::string> suitableRoles(const parsing::CandidateProfile& profile) const;
    std::vector<std::string> skillGaps(const parsing::CandidateProfile& profile) const;
    std::vector<std::string> missingKeywords(const parsing::CandidateProfile& profile,
                                             const std::optional<std::string>& targetJob) const;

    int currentYear() const;

    int referenceYear_;
};

} // namespace cvpipe::services
