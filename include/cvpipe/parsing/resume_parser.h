#pragma once

#include <map>
#include <string>
#include <string_view>

#include <cvpipe/core/types.h>
#include <cvpipe/parsing/profile.h>

namespace cvpipe::parsing {

/**
 * @brief Weights of the parsing confidence estimate
 */
struct ParsingWeights {
    double extraction = 0.3; // upstream extraction confidence
    double contact = 0.2;    // share of name/email/phone present
    double sections = 0.2;   // share of section types found
    double content = 0.3;    // presence of key content

    double experienceContent = 0.3;
    double educationContent = 0.2;
    double skillsContent = 0.2;
    double summaryContent = 0.1;
};

/**
 * @brief Turns extracted text into a CandidateProfile
 *
 * Stateless; one instance may be shared between threads.
 */
class ResumeParser {
public:
    ResumeParser() = default;
    explicit ResumeParser(ParsingWeights weights) : weights_(weights) {}

    /**
     * @brief Normalize, segment and extract every field
     * @param text Extracted text (normalized here again; normalization is idempotent)
     * @param extractionConfidence Confidence of the text source, folded into the score
     * @return Profile, or ParsingFailed when the text is empty after normalization
     */
    Result<CandidateProfile> parse(std::string_view text, double extractionConfidence) const;

    /**
     * @brief Parsing confidence of a finished profile
     */
    double confidence(const CandidateProfile& profile, double extractionConfidence) const;

    [[nodiscard]] const ParsingWeights& weights() const { return weights_; }

private:
    void fillSections(const std::map<SectionType, std::string>& sections,
                      std::string_view fullText, CandidateProfile& profile) const;

    ParsingWeights weights_;
};

/// Fraction of name, email and phone present
double contactCompleteness(const ContactInfo& contact);

} // namespace cvpipe::parsing
