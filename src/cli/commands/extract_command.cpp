#include <fmt/format.h>

#include <iostream>

#include <cvpipe/cli/command.h>
#include <cvpipe/cli/cvpipe_cli.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/extraction_engine.h>
#include <cvpipe/io/json_serialization.h>

namespace cvpipe::cli {

class ExtractCommand : public ICommand {
public:
    std::string getName() const override { return "extract"; }

    std::string getDescription() const override {
        return "Extract text from a resume and print it";
    }

    void registerCommand(CLI::App& app, CvpipeCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("file", file_, "Resume file (PDF or text)")->required();
        cmd->add_option("--method", method_, "Extraction engine or 'auto'")->default_val("auto");
        cmd->add_flag("--no-fallback", noFallback_, "Do not try other engines on poor output");
        cmd->add_option("--max-pages", maxPages_, "Only extract the first N pages");
        cmd->add_flag("--json", json_, "Print the extraction result as JSON");
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

        auto document = extraction::Document::open(file_);
        if (!document) {
            return document.error();
        }

        auto caps = extraction::EngineCapabilities::probe(config.extraction);
        auto engine = extraction::ExtractionEngine::createDefault(caps, config.engine);
        core::StopCondition stop{cli_->cancellationToken(), std::nullopt};
        auto result = engine->extract(document.value(), config.extraction, stop);
        if (!result) {
            return result.error();
        }

        const auto& extracted = result.value();
        if (json_) {
            std::cout << io::dumpJson(io::toJson(extracted)) << std::endl;
            return {};
        }

        std::cout << fmt::format("engine:     {}\n", extraction::engineName(extracted.method));
        std::cout << fmt::format("confidence: {:.2f}\n", extracted.confidence);
        std::cout << fmt::format("pages:      {}\n", extracted.pageCount);
        for (const auto& attempt : extracted.attempts) {
            std::cout << fmt::format("attempt:    {} {} chars, confidence {:.2f}{}\n",
                                     extraction::engineName(attempt.engine), attempt.textLength,
                                     attempt.confidence,
                                     attempt.error.empty() ? "" : " (" + attempt.error + ")");
        }
        std::cout << "\n" << extracted.text << std::endl;
        return {};
    }

private:
    CvpipeCLI* cli_ = nullptr;
    std::string file_;
    std::string method_ = "auto";
    bool noFallback_ = false;
    size_t maxPages_ = 0;
    bool json_ = false;
};

std::unique_ptr<ICommand> createExtractCommand() {
    return std::make_unique<ExtractCommand>();
}

} // namespace cvpipe::cli
