#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include <cvpipe/core/cancellation.h>
#include <cvpipe/pipeline/orchestrator.h>

namespace cvpipe::pipeline {

struct BatchSummary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    double successRate = 0.0;
    // Score averages cover successful runs; failed runs carry no scores
    double averageConfidence = 0.0;
    double averageQuality = 0.0;
    std::chrono::milliseconds averageProcessingTime{0}; // per document, all runs
    std::chrono::milliseconds wallTime{0};
};

/**
 * @brief Runs many documents through one orchestrator on a worker pool
 *
 * Workers share the orchestrator (read-only config, probed capabilities, stateless
 * collaborators). Results come back in input order.
 */
class BatchProcessor {
public:
    using ProgressCallback = std::function<void(size_t done, size_t total, const PipelineResult&)>;

    /// @param workers Thread count; 0 uses the hardware concurrency
    explicit BatchProcessor(std::shared_ptr<const PipelineOrchestrator> orchestrator,
                            size_t workers = 0);

    std::vector<PipelineResult> processFiles(const std::vector<std::filesystem::path>& paths,
                                             core::CancellationToken token = {},
                                             ProgressCallback progress = {}) const;

    static BatchSummary summarize(const std::vector<PipelineResult>& results,
                                  std::chrono::milliseconds wallTime = {});

    [[nodiscard]] size_t workers() const { return workers_; }

private:
    std::shared_ptr<const PipelineOrchestrator> orchestrator_;
    size_t workers_;
};

} // namespace cvpipe::pipeline
