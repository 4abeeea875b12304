#include "archiver.hpp"
#include <csignal>
#include <exception>
#include <fmt/format.h>

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto options = parseArguments(args);
    if (!options) {
        fmt::print(stderr, "Error: {}\n{}", options.error(), usage(argv[0]));
        return 1;
    }
    if (options->showHelp) {
        fmt::print("{}", usage(argv[0]));
        return 0;
    }

    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    try {
        Archiver archiver(options->configFile);
        return archiver.run(*options, [] { return gShutdownFlag != 0; });
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
