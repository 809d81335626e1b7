#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <cvpipe/cli/cvpipe_cli.h>
#include <cvpipe/config/config_helpers.h>
#include <cvpipe/config/config_loader.h>

#ifndef CVPIPE_VERSION_STRING
#define CVPIPE_VERSION_STRING "0.1.0"
#endif

namespace cvpipe::cli {

CvpipeCLI::CvpipeCLI() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Resume extraction and parsing pipeline", "cvpipe");
    app_->set_version_flag("--version", CVPIPE_VERSION_STRING);
    app_->require_subcommand(1);

    // Global options
    app_->add_option("-c,--config", configPath_, "Path to config.toml");
    app_->add_option("--log-level", logLevel_,
                     "Log level: trace, debug, info, warn, error, critical, off");
    app_->add_option("--log-file", logFile_, "Also write logs to this file");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output (debug logging)");
}

CvpipeCLI::~CvpipeCLI() = default;

void CvpipeCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void CvpipeCLI::registerBuiltinCommands() {
    commands_.push_back(createProcessCommand());
    commands_.push_back(createExtractCommand());
    commands_.push_back(createParseCommand());
    commands_.push_back(createEnginesCommand());
    for (auto& cmd : commands_) {
        cmd->registerCommand(*app_, this);
    }
}

void CvpipeCLI::configureLogging() const {
    // Precedence: --verbose > --log-level > CVPIPE_LOG_LEVEL > config [logging] level > warn
    std::string level = logLevel_;
    if (level.empty()) {
        if (const char* env = std::getenv("CVPIPE_LOG_LEVEL"); env && *env) {
            level = env;
        }
    }
    auto cfgPath = config::get_config_path(configPath_);
    if (level.empty() && std::filesystem::exists(cfgPath)) {
        level = config::parse_config_value(cfgPath, "logging", "level");
    }
    if (verbose_) {
        level = "debug";
    }

    auto parsed = level.empty() ? spdlog::level::warn : spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::warn;
    }

    std::string file = logFile_;
    if (file.empty() && std::filesystem::exists(cfgPath)) {
        file = config::parse_config_value(cfgPath, "logging", "file");
    }

    if (!file.empty()) {
        try {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config::expand_tilde(file).string(), false);
            auto logger = std::make_shared<spdlog::logger>(
                "cvpipe", spdlog::sinks_init_list{console, fileSink});
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", file, e.what());
        }
    } else {
        spdlog::set_default_logger(spdlog::stderr_color_mt("cvpipe"));
    }

    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(parsed);
}

Result<pipeline::PipelineConfig> CvpipeCLI::loadBaseConfig() const {
    pipeline::PipelineConfig base;
    // Raw text is opt-in on the command line (--include-raw-text or the config file)
    base.includeRawText = false;

    std::string explicitPath = configPath_;
    if (explicitPath.empty()) {
        if (const char* env = std::getenv("CVPIPE_CONFIG"); env && *env) {
            explicitPath = env;
        }
    }

    if (!explicitPath.empty()) {
        auto loaded = config::loadPipelineConfig(config::expand_tilde(explicitPath), base);
        if (!loaded) {
            return Error{ErrorCode::InvalidArgument, loaded.error().message};
        }
        return loaded;
    }

    auto defaultPath = config::get_config_path();
    if (std::filesystem::exists(defaultPath)) {
        auto loaded = config::loadPipelineConfig(defaultPath, base);
        if (!loaded) {
            return Error{ErrorCode::InvalidArgument, loaded.error().message};
        }
        return loaded;
    }
    return base;
}

int CvpipeCLI::run(int argc, char* argv[]) {
    registerBuiltinCommands();

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app_->exit(e);
        return code == 0 ? kExitSuccess : kExitUsage;
    }

    configureLogging();

    if (!pendingCommand_) {
        std::cerr << app_->help() << std::endl;
        return kExitUsage;
    }

    auto result = pendingCommand_->execute();
    if (result) {
        return kExitSuccess;
    }

    const auto& error = result.error();
    spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(), error.message, error.code);
    std::cerr << "Error: " << error.message << std::endl;
    return error.code == ErrorCode::InvalidArgument ? kExitUsage : kExitFailure;
}

} // namespace cvpipe::cli
