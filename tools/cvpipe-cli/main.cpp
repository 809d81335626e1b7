#include <csignal>

#include <spdlog/spdlog.h>
#include <cvpipe/cli/cvpipe_cli.h>

namespace {

cvpipe::cli::CvpipeCLI* g_cli = nullptr;

void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_cli) {
        // Running stages observe the token between units of work
        g_cli->requestCancel();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        cvpipe::cli::CvpipeCLI cli;
        g_cli = &cli;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        int result = cli.run(argc, argv);
        g_cli = nullptr;
        return result;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return cvpipe::cli::kExitFailure;
    }
}
