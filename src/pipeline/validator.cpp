#include <fmt/format.h>
#include <cvpipe/pipeline/validator.h>

namespace cvpipe::pipeline {

ValidationReport Validator::validate(const extraction::ExtractionResult* extraction,
                                     const parsing::CandidateProfile* profile) const {
    ValidationReport report;

    if (extraction) {
        if (extraction->confidence < thresholds_.minExtractionConfidence) {
            report.warnings.push_back(
                fmt::format("Low PDF extraction confidence ({:.2f})", extraction->confidence));
        }
        if (extraction->text.size() < thresholds_.minTextLength) {
            report.warnings.push_back(fmt::format("Very little text extracted ({} characters)",
                                                  extraction->text.size()));
        }
    }

    if (profile) {
        if (profile->parsingConfidence < thresholds_.minParsingConfidence) {
            report.warnings.push_back(
                fmt::format("Low parsing confidence ({:.2f} below {:.2f})",
                            profile->parsingConfidence, thresholds_.minParsingConfidence));
        }
        if (!profile->contact.email) {
            report.warnings.emplace_back("No email found");
        }
        if (profile->experience.empty()) {
            report.warnings.emplace_back("No work experience found");
        }
    }

    return report;
}

} // namespace cvpipe::pipeline
