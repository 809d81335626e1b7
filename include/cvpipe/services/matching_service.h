#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <cvpipe/core/types.h>
#include <cvpipe/parsing/profile.h>

namespace cvpipe::services {

/**
 * @brief How well a profile fits a job description
 */
struct MatchReport {
    double overallMatch = 0.0;
    double skillMatch = 0.0;
    double keywordMatch = 0.0;
    std::vector<std::string> matchedSkills;
    std::vector<std::string> missingSkills;

    bool operator==(const MatchReport&) const = default;
};

/**
 * @brief Matching collaborator consumed by the pipeline's Matching stage
 */
class IMatchingService {
public:
    virtual ~IMatchingService() = default;

    virtual Result<MatchReport> match(const parsing::CandidateProfile& profile,
                                      std::string_view jobText) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Skill-vocabulary and word-overlap matcher
 *
 * overall = skillWeight * skillMatch + keywordWeight * keywordMatch + baseScore
 */
class KeywordMatcher : public IMatchingService {
public:
    struct Weights {
        double skill = 0.4;
        double keyword = 0.3;
        double base = 0.3;
    };

    KeywordMatcher() = default;
    explicit KeywordMatcher(Weights weights) : weights_(weights) {}

    Result<MatchReport> match(const parsing::CandidateProfile& profile,
                              std::string_view jobText) override;

    std::string name() const override { return "keyword"; }

private:
    Weights weights_;
};

} // namespace cvpipe::services
