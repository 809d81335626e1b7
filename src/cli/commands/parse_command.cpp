#include <fmt/format.h>

#include <iostream>

#include <cvpipe/cli/command.h>
#include <cvpipe/cli/cvpipe_cli.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/io/json_serialization.h>
#include <cvpipe/parsing/resume_parser.h>

namespace cvpipe::cli {

// Parsing only, over text that was extracted earlier
class ParseCommand : public ICommand {
public:
    std::string getName() const override { return "parse"; }

    std::string getDescription() const override {
        return "Parse an already extracted text file and print the profile as JSON";
    }

    void registerCommand(CLI::App& app, CvpipeCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("textfile", file_, "Plain text resume")->required();
        cmd->add_option("--confidence", confidence_, "Confidence of the text source")
            ->default_val(1.0)
            ->check(CLI::Range(0.0, 1.0));
        cmd->add_option("-o,--output", output_, "Write the profile JSON to this file");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto base = cli_->loadBaseConfig();
        if (!base) {
            return base.error();
        }

        auto document = extraction::Document::open(file_);
        if (!document) {
            return document.error();
        }
        const auto& bytes = document.value().bytes();
        std::string text(reinterpret_cast<const char*>(bytes.data()), bytes.size());

        parsing::ResumeParser parser(base.value().parsing);
        auto profile = parser.parse(text, confidence_);
        if (!profile) {
            return profile.error();
        }

        auto j = io::toJson(profile.value());
        if (!output_.empty()) {
            return io::writeJsonFile(output_, j);
        }
        std::cout << io::dumpJson(j) << std::endl;
        return {};
    }

private:
    CvpipeCLI* cli_ = nullptr;
    std::string file_;
    double confidence_ = 1.0;
    std::string output_;
};

std::unique_ptr<ICommand> createParseCommand() {
    return std::make_unique<ParseCommand>();
}

} // namespace cvpipe::cli
