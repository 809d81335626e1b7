#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <cvpipe/cli/command.h>
#include <cvpipe/cli/cvpipe_cli.h>
#include <cvpipe/io/json_serialization.h>
#include <cvpipe/pipeline/batch_processor.h>
#include <cvpipe/pipeline/orchestrator.h>

namespace cvpipe::cli {

namespace {

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, fmt::format("Cannot read {}", path.string())};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void printSummary(const pipeline::PipelineResult& result) {
    std::cout << result.inputRef << ": " << (result.overallSuccess ? "OK" : "FAILED");
    if (result.cancelled) {
        std::cout << " (cancelled)";
    }
    std::cout << "\n";

    if (const auto* extraction = result.extraction()) {
        std::cout << fmt::format("  extraction   {} (confidence {:.2f}, {} pages, {} chars)\n",
                                 extraction::engineName(extraction->method),
                                 extraction->confidence, extraction->pageCount,
                                 extraction->contentLength());
    }
    if (const auto* profile = result.profile()) {
        std::cout << fmt::format("  candidate    {}\n", profile->contact.name.value_or("(unknown)"));
        std::cout << fmt::format("  email        {}\n", profile->contact.email.value_or("-"));
        std::cout << fmt::format("  sections     {}  experience {}  education {}  skills {}\n",
                                 profile->sectionsFound.size(), profile->experience.size(),
                                 profile->education.size(), profile->skills.size());
    }
    if (const auto* enhancement = result.enhancement()) {
        std::cout << fmt::format("  assessment   {:.2f} ({})\n", enhancement->overallScore,
                                 enhancement->estimatedExperienceLevel);
    }
    if (const auto* match = result.match()) {
        std::cout << fmt::format("  job match    {:.2f}\n", match->overallMatch);
    }
    std::cout << fmt::format("  scores       confidence {:.2f}  quality {:.2f}", result.confidenceScore,
                             result.qualityScore)
              << fmt::format("  completeness {:.2f}\n", result.completenessScore);
    for (const auto& error : result.errors) {
        std::cout << "  error: " << error << "\n";
    }
    for (const auto& warning : result.warnings) {
        std::cout << "  warning: " << warning << "\n";
    }
}

} // namespace

class ProcessCommand : public ICommand {
public:
    std::string getName() const override { return "process"; }

    std::string getDescription() const override {
        return "Run the full pipeline over one or more resumes";
    }

    void registerCommand(CLI::App& app, CvpipeCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("files", files_, "Resume files (PDF or text)")->required();
        cmd->add_option("--job-description", jobFile_, "Target job description text file");
        cmd->add_flag("--no-enhance", noEnhance_, "Skip the enhancement stage");
        cmd->add_flag("--match", match_, "Match against the job description");
        cmd->add_option("--method", method_,
                        "Extraction engine: auto, qpdf, poppler, pdftotext, ocr, plain_text")
            ->default_val("auto");
        cmd->add_flag("--no-fallback", noFallback_, "Do not try other engines on poor output");
        cmd->add_option("--max-pages", maxPages_, "Only extract the first N pages");
        cmd->add_option("--ocr-lang", ocrLangs_, "Tesseract language (repeatable)");
        cmd->add_option("-o,--output", output_, "Write JSON results to this file");
        cmd->add_option("--workers", workers_, "Worker threads for batches (0 = all cores)");
        cmd->add_flag("--include-raw-text", includeRawText_,
                      "Keep the extracted text in the results");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto base = cli_->loadBaseConfig();
        if (!base) {
            return base.error();
        }
        auto config = std::move(base).value();

        if (method_ != "auto") {
            auto id = extraction::engineFromString(method_);
            if (!id) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("Unknown extraction method '{}'", method_)};
            }
            config.extraction.preferredMethod = *id;
        }
        if (noFallback_) {
            config.extraction.useFallback = false;
        }
        if (maxPages_ > 0) {
            config.extraction.maxPages = maxPages_;
        }
        if (!ocrLangs_.empty()) {
            config.extraction.ocrLanguages = ocrLangs_;
        }
        if (noEnhance_) {
            config.enableEnhancement = false;
        }
        if (match_) {
            config.enableMatching = true;
        }
        if (includeRawText_) {
            config.includeRawText = true;
        }
        if (workers_ > 0) {
            config.workers = workers_;
        }
        if (!jobFile_.empty()) {
            auto job = readFile(jobFile_);
            if (!job) {
                return Error{ErrorCode::InvalidArgument, job.error().message};
            }
            config.jobDescription = std::move(job).value();
        }

        const size_t workers = config.workers;
        std::shared_ptr<const pipeline::PipelineOrchestrator> orchestrator =
            pipeline::PipelineOrchestrator::create(std::move(config));
        spdlog::info("Extraction engines: {}", orchestrator->engine().capabilities().describe());

        const auto started = std::chrono::steady_clock::now();
        std::vector<pipeline::PipelineResult> results;
        if (files_.size() == 1) {
            results.push_back(orchestrator->runFile(files_.front(), cli_->cancellationToken()));
        } else {
            pipeline::BatchProcessor batch(orchestrator, workers);
            results = batch.processFiles(
                files_, cli_->cancellationToken(),
                [](size_t done, size_t total, const pipeline::PipelineResult& r) {
                    spdlog::info("[{}/{}] {} {}", done, total, r.inputRef,
                                 r.overallSuccess ? "done" : "failed");
                });
        }
        const auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        for (const auto& result : results) {
            printSummary(result);
        }

        auto summary = pipeline::BatchProcessor::summarize(results, wall);
        if (results.size() > 1) {
            std::cout << fmt::format("{} processed, {} succeeded, {} failed in {}ms\n",
                                     summary.total, summary.succeeded, summary.failed,
                                     summary.wallTime.count());
            std::cout << fmt::format(
                "success rate {:.0f}%  avg confidence {:.2f}  avg quality {:.2f}  "
                "avg time {}ms\n",
                summary.successRate * 100.0, summary.averageConfidence, summary.averageQuality,
                summary.averageProcessingTime.count());
        }

        if (!output_.empty()) {
            io::json out;
            if (results.size() == 1) {
                out = io::toJson(results.front());
            } else {
                out = io::json::array();
                for (const auto& result : results) {
                    out.push_back(io::toJson(result));
                }
            }
            auto written = io::writeJsonFile(output_, out);
            if (!written) {
                return written.error();
            }
            spdlog::info("Wrote results to {}", output_);
        }

        if (summary.failed > 0) {
            return Error{ErrorCode::ExtractionFailed,
                         fmt::format("{} of {} document(s) failed", summary.failed,
                                     summary.total)};
        }
        return {};
    }

private:
    CvpipeCLI* cli_ = nullptr;
    std::vector<std::filesystem::path> files_;
    std::string jobFile_;
    bool noEnhance_ = false;
    bool match_ = false;
    std::string method_ = "auto";
    bool noFallback_ = false;
    size_t maxPages_ = 0;
    std::vector<std::string> ocrLangs_;
    std::string output_;
    size_t workers_ = 0;
    bool includeRawText_ = false;
};

std::unique_ptr<ICommand> createProcessCommand() {
    return std::make_unique<ProcessCommand>();
}

} // namespace cvpipe::cli
