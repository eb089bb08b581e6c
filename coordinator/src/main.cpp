#include "cli.hpp"
#include "logger.hpp"
#include "protocol.hpp"

#include <log4cplus/initializer.h>

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    // CRIU runs us as an action script and passes no arguments we understand.
    if (const char* hook_action = std::getenv(coord::kEnvAction)) {
        init_logging("log4cplus.ini");
        return coord::cli::run_action_hook(hook_action, std::cout, std::cerr);
    }

    coord::cli::CommandLine cmdline;
    try {
        cmdline = coord::cli::parse_command_line(argc, argv);
    } catch (const coord::cli::UsageError& exc) {
        std::cerr << exc.what() << "\n\n";
        coord::cli::print_usage(std::cerr, argv[0]);
        return 1;
    }

    if (cmdline.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }
    if (cmdline.show_help) {
        coord::cli::print_usage(std::cout, argv[0]);
        return 0;
    }

    init_logging(cmdline.log_config);
    return coord::cli::run_command(cmdline, std::cout, std::cerr);
}
