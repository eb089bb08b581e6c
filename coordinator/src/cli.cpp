#include "cli.hpp"

#include "action/action.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace coord::cli {

namespace {

// Accepts "--name value" and "--name=value"; `alias` may be null.
bool take_option(int argc, char** argv, int& i, const char* name, const char* alias, std::string& value) {
    size_t len = std::strlen(name);
    if ((std::strcmp(argv[i], name) == 0 || (alias && std::strcmp(argv[i], alias) == 0)) && i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

bool is_registration(const std::string& command) {
    return command == "add-dependencies" || command == "deps";
}

bool is_client(const std::string& command) {
    return command == "client" || command == "c";
}

int run_with_config(const std::string& action,
                    const config::ClientConfig& config,
                    const std::filesystem::path& images_dir,
                    std::ostream& out,
                    std::ostream& err) {
    try {
        set_log_file(config.log_file, images_dir);
        if (!actions::run_action(action, config, out)) {
            err << "Error: " << action << " was not acknowledged" << std::endl;
            return 1;
        }
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(core_logger(), action << " failed: " << exc.what());
        err << "Error: " << exc.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

void print_usage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " [--log-config FILE] [COMMAND] [OPTIONS]\n"
       << "\n"
       << "Commands:\n"
       << "  add-dependencies   Register the dependency map of a workload (default)\n"
       << "  client             Run one checkpoint/restore action\n"
       << "\n"
       << "Common options:\n"
       << "  --address ADDR        Coordinator address (default " << kDefaultAddress << ")\n"
       << "  -p, --port PORT       Coordinator port (default " << kDefaultPort << ")\n"
       << "  --timeout-ms MS       Bound on the wait for the reply (default: wait forever)\n"
       << "  -o, --log-file FILE   Log file name, '-' for standard output\n"
       << "\n"
       << "add-dependencies options:\n"
       << "  --deps-file FILE      JSON object mapping components to their dependencies\n"
       << "  --components A,B,C    Link every listed component with every other one\n"
       << "\n"
       << "client options:\n"
       << "  -i, --id ID           Unique client ID (required)\n"
       << "  -d, --deps DEPS       Colon-separated list of dependency IDs\n"
       << "  -a, --action ACTION   pre-dump, post-dump, pre-restore or post-restore (default pre-dump)\n"
       << "  -D, --images-dir DIR  Directory a relative log file is written to (default .)\n"
       << "\n"
       << "  -v, --version         Print version information\n"
       << "  -h, --help            Print this message\n";
}

CommandLine parse_command_line(int argc, char** argv) {
    CommandLine cmdline;
    bool command_seen = false;
    // First option seen that only one of the commands accepts.
    std::string registration_option;
    std::string client_option;

    for (int i = 1; i < argc; ++i) {
        std::string value;
        const char* arg = argv[i];

        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            cmdline.show_version = true;
            return cmdline;
        }
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            cmdline.show_help = true;
            return cmdline;
        }

        if (take_option(argc, argv, i, "--log-config", nullptr, value)) {
            cmdline.log_config = value;
        } else if (take_option(argc, argv, i, "--address", nullptr, value)) {
            cmdline.config.address = value;
        } else if (take_option(argc, argv, i, "--port", "-p", value)) {
            cmdline.port = value;
        } else if (take_option(argc, argv, i, "--timeout-ms", nullptr, value)) {
            cmdline.timeout = value;
        } else if (take_option(argc, argv, i, "--log-file", "-o", value)) {
            cmdline.config.log_file = value;
        } else if (take_option(argc, argv, i, "--deps-file", nullptr, value)) {
            cmdline.deps_file = value;
            if (registration_option.empty()) registration_option = arg;
        } else if (take_option(argc, argv, i, "--components", nullptr, value)) {
            cmdline.components = value;
            if (registration_option.empty()) registration_option = arg;
        } else if (take_option(argc, argv, i, "--id", "-i", value)) {
            cmdline.config.id = value;
            if (client_option.empty()) client_option = arg;
        } else if (take_option(argc, argv, i, "--deps", "-d", value)) {
            cmdline.config.dependencies = value;
            if (client_option.empty()) client_option = arg;
        } else if (take_option(argc, argv, i, "--action", "-a", value)) {
            cmdline.action = value;
            if (client_option.empty()) client_option = arg;
        } else if (take_option(argc, argv, i, "--images-dir", "-D", value)) {
            cmdline.images_dir = value;
            if (client_option.empty()) client_option = arg;
        } else if (arg[0] != '-' && !command_seen) {
            cmdline.command = arg;
            command_seen = true;
        } else {
            throw UsageError(std::string("Unknown argument: ") + arg);
        }
    }

    if (is_registration(cmdline.command) && !client_option.empty()) {
        throw UsageError(client_option + " is not valid for the add-dependencies command");
    }
    if (is_client(cmdline.command) && !registration_option.empty()) {
        throw UsageError(registration_option + " is not valid for the client command");
    }
    if (!is_registration(cmdline.command) && !is_client(cmdline.command)) {
        throw UsageError("Unknown command: " + cmdline.command);
    }
    return cmdline;
}

int run_command(const CommandLine& cmdline, std::ostream& out, std::ostream& err) {
    config::ClientConfig config = cmdline.config;
    try {
        if (!cmdline.port.empty()) {
            config.port = config::parse_port(cmdline.port);
        }
        if (!cmdline.timeout.empty()) {
            config.receive_timeout = config::parse_timeout_ms(cmdline.timeout);
        }

        if (is_registration(cmdline.command)) {
            if (!cmdline.deps_file.empty()) {
                config.dependency_map = config::load_dependency_file(cmdline.deps_file);
            } else if (!cmdline.components.empty()) {
                config.dependency_map = codec::full_mesh(codec::split_list(cmdline.components, ','));
            }
        }
    } catch (const config::ConfigError& exc) {
        LOG4CPLUS_ERROR(core_logger(), exc.what());
        err << "Error: " << exc.what() << std::endl;
        return 1;
    }

    if (is_registration(cmdline.command)) {
        config.id = kRegistrarId;
        return run_with_config(kActionAddDependencies, config, {}, out, err);
    }

    if (config.id.empty()) {
        err << "Error: --id is required for the client command" << std::endl;
        return 1;
    }
    if (cmdline.action == kActionAddDependencies) {
        err << "Error: use the add-dependencies command to register dependencies" << std::endl;
        return 1;
    }
    if (!actions::has_action(cmdline.action)) {
        err << "Error: unknown action '" << cmdline.action << "'" << std::endl;
        return 1;
    }
    return run_with_config(cmdline.action, config, cmdline.images_dir, out, err);
}

int run_action_hook(const std::string& action, std::ostream& out, std::ostream& err) {
    if (action == kActionAddDependencies || !actions::has_action(action)) {
        LOG4CPLUS_DEBUG(core_logger(), "Ignoring hook action " << action);
        return 0;
    }

    std::string images_dir;
    config::ClientConfig config;
    try {
        const char* env = std::getenv(kEnvImageDir);
        if (!env || env[0] == '\0') {
            throw config::ConfigError(std::string("Missing environment variable: ") + kEnvImageDir);
        }
        images_dir = env;
        config = config::load_config_file(images_dir);
    } catch (const config::ConfigError& exc) {
        LOG4CPLUS_ERROR(core_logger(), exc.what());
        err << "Error: " << exc.what() << std::endl;
        return 1;
    }

    return run_with_config(action, config, images_dir, out, err);
}

} // namespace coord::cli
