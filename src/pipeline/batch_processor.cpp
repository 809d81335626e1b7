#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <mutex>
#include <thread>

#include <cvpipe/pipeline/batch_processor.h>

namespace cvpipe::pipeline {

BatchProcessor::BatchProcessor(std::shared_ptr<const PipelineOrchestrator> orchestrator,
                               size_t workers)
    : orchestrator_(std::move(orchestrator)), workers_(workers) {
    if (workers_ == 0) {
        workers_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

std::vector<PipelineResult>
BatchProcessor::processFiles(const std::vector<std::filesystem::path>& paths,
                             core::CancellationToken token, ProgressCallback progress) const {
    std::vector<PipelineResult> results(paths.size());
    if (paths.empty()) {
        return results;
    }

    const size_t threads = std::min(workers_, paths.size());
    spdlog::info("Processing {} document(s) on {} worker(s)", paths.size(), threads);

    std::mutex progressMutex;
    size_t done = 0;

    boost::asio::thread_pool pool(threads);
    for (size_t i = 0; i < paths.size(); ++i) {
        boost::asio::post(pool, [&, i]() {
            // Each slot is written by exactly one job
            results[i] = orchestrator_->runFile(paths[i], token);
            if (progress) {
                std::lock_guard<std::mutex> lock(progressMutex);
                progress(++done, paths.size(), results[i]);
            }
        });
    }
    pool.join();

    return results;
}

BatchSummary BatchProcessor::summarize(const std::vector<PipelineResult>& results,
                                       std::chrono::milliseconds wallTime) {
    BatchSummary summary;
    summary.total = results.size();
    summary.wallTime = wallTime;

    double confidenceSum = 0.0;
    double qualitySum = 0.0;
    std::chrono::milliseconds elapsedSum{0};
    for (const auto& result : results) {
        elapsedSum += result.totalElapsed;
        if (result.cancelled) {
            ++summary.cancelled;
        }
        if (result.overallSuccess) {
            ++summary.succeeded;
            confidenceSum += result.confidenceScore;
            qualitySum += result.qualityScore;
        } else {
            ++summary.failed;
        }
    }
    if (summary.total == 0) {
        return summary;
    }
    summary.successRate =
        static_cast<double>(summary.succeeded) / static_cast<double>(summary.total);
    summary.averageProcessingTime =
        elapsedSum / static_cast<std::chrono::milliseconds::rep>(summary.total);
    if (summary.succeeded > 0) {
        const auto n = static_cast<double>(summary.succeeded);
        summary.averageConfidence = confidenceSum / n;
        summary.averageQuality = qualitySum / n;
    }
    return summary;
}

} // namespace cvpipe::pipeline
