#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <cvpipe/core/types.h>

namespace cvpipe::cli {

class CvpipeCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "process", "extract")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, CvpipeCLI* cli) = 0;

    /**
     * Execute the command. InvalidArgument maps to the usage exit code, any other error
     * to the failure exit code.
     */
    virtual Result<void> execute() = 0;
};

std::unique_ptr<ICommand> createProcessCommand();
std::unique_ptr<ICommand> createExtractCommand();
std::unique_ptr<ICommand> createParseCommand();
std::unique_ptr<ICommand> createEnginesCommand();

} // namespace cvpipe::cli
