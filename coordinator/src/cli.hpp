#pragma once

#include "client_config.hpp"
#include "protocol.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace coord::cli {

// Malformed command line. The message is printed before the usage text.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    std::string command = "add-dependencies";
    std::string action = kActionPreDump;
    std::string images_dir = ".";
    std::string log_config = "log4cplus.ini";
    std::string deps_file;
    std::string components;
    std::string port;
    std::string timeout;
    bool show_version = false;
    bool show_help = false;
    config::ClientConfig config;
};

/**
 * Parse argv into a CommandLine.
 *
 * Options may appear before or after the command. An option that belongs to
 * the other command, an unknown argument or a second command throws
 * UsageError. -h and -v stop parsing.
 */
CommandLine parse_command_line(int argc, char** argv);

void print_usage(std::ostream& os, const char* prog);

// Runs add-dependencies or client. Returns the process exit status.
int run_command(const CommandLine& cmdline, std::ostream& out, std::ostream& err);

/**
 * Run `action` as a CRIU action script. The configuration comes from
 * criu-coordinator.json found through $CRTOOLS_IMAGE_DIR. Hooks without a
 * handler exit 0 without connecting.
 */
int run_action_hook(const std::string& action, std::ostream& out, std::ostream& err);

} // namespace coord::cli
