#include <cvpipe/pipeline/pipeline_result.h>

namespace cvpipe::pipeline {

const char* stageName(StageId id) {
    switch (id) {
        case StageId::Extraction:
            return "extraction";
        case StageId::Parsing:
            return "parsing";
        case StageId::Enhancement:
            return "enhancement";
        case StageId::Matching:
            return "matching";
        case StageId::Validation:
            return "validation";
    }
    return "unknown";
}

const char* statusName(StageStatus status) {
    switch (status) {
        case StageStatus::Pending:
            return "pending";
        case StageStatus::InProgress:
            return "in_progress";
        case StageStatus::Completed:
            return "completed";
        case StageStatus::Failed:
            return "failed";
        case StageStatus::Skipped:
            return "skipped";
    }
    return "unknown";
}

} // namespace cvpipe::pipeline
