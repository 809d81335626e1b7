#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <cvpipe/cli/command.h>
#include <cvpipe/core/cancellation.h>
#include <cvpipe/pipeline/pipeline_config.h>

namespace cvpipe::cli {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

/**
 * @brief Top-level command line: global options, logging setup and subcommand dispatch
 */
class CvpipeCLI {
public:
    CvpipeCLI();
    ~CvpipeCLI();

    int run(int argc, char* argv[]);

    void setPendingCommand(ICommand* cmd);

    /**
     * @brief Defaults overlaid with the config file
     *
     * The file is --config, else $CVPIPE_CONFIG, else the XDG default when it exists.
     * An explicitly named file that cannot be read is an error.
     */
    Result<pipeline::PipelineConfig> loadBaseConfig() const;

    core::CancellationToken cancellationToken() const { return token_; }

    /// Cancels the token handed to running pipelines
    void requestCancel() { token_.cancel(); }

private:
    void registerBuiltinCommands();
    void configureLogging() const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string configPath_;
    std::string logLevel_;
    std::string logFile_;
    bool verbose_ = false;

    core::CancellationToken token_;
};

} // namespace cvpipe::cli
