#include <iostream>

#include <cvpipe/cli/command.h>
#include <cvpipe/cli/cvpipe_cli.h>
#include <cvpipe/extraction/method_selector.h>

namespace cvpipe::cli {

class EnginesCommand : public ICommand {
public:
    std::string getName() const override { return "engines"; }

    std::string getDescription() const override {
        return "List the extraction engines available on this host";
    }

    void registerCommand(CLI::App& app, CvpipeCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto base = cli_->loadBaseConfig();
        if (!base) {
            return base.error();
        }
        auto caps = extraction::EngineCapabilities::probe(base.value().extraction);

        for (auto id : {extraction::EngineId::Qpdf, extraction::EngineId::Poppler,
                        extraction::EngineId::Pdftotext, extraction::EngineId::Ocr,
                        extraction::EngineId::PlainText}) {
            std::cout << (caps.has(id) ? "  [x] " : "  [ ] ") << extraction::engineName(id)
                      << "\n";
        }
        std::cout << "fallback order: ";
        for (size_t i = 0; i < extraction::kFallbackOrder.size(); ++i) {
            std::cout << (i ? " -> " : "") << extraction::engineName(extraction::kFallbackOrder[i]);
        }
        std::cout << std::endl;
        return {};
    }

private:
    CvpipeCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createEnginesCommand() {
    return std::make_unique<EnginesCommand>();
}

} // namespace cvpipe::cli
