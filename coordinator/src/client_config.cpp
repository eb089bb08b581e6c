#include "client_config.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

namespace coord::config {

namespace {

constexpr const char* kKeyId = "id";
constexpr const char* kKeyDependencies = "dependencies";
constexpr const char* kKeyAddress = "address";
constexpr const char* kKeyPort = "port";
constexpr const char* kKeyLogFile = "log-file";
constexpr const char* kKeyTimeout = "timeout-ms";

bool all_digits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (unsigned char c : text) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    return true;
}

// Values are accepted as strings or numbers, the way the coordinator's own
// config loader flattens them.
std::string value_as_string(const nlohmann::json& value, const char* key) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned() || value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    throw ConfigError(std::string("Failed to parse config: '") + key + "' must be a string");
}

nlohmann::json read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Configuration error: cannot open " + path.string());
    }

    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& exc) {
        throw ConfigError("Failed to parse config " + path.string() + ": " + exc.what());
    }
}

} // namespace

uint16_t parse_port(const std::string& text) {
    if (!all_digits(text) || text.size() > 5) {
        throw ConfigError("Invalid port: '" + text + "'");
    }
    unsigned long value = std::stoul(text);
    if (value == 0 || value > UINT16_MAX) {
        throw ConfigError("Invalid port: '" + text + "'");
    }
    return static_cast<uint16_t>(value);
}

std::chrono::milliseconds parse_timeout_ms(const std::string& text) {
    if (!all_digits(text) || text.size() > 9) {
        throw ConfigError("Invalid timeout: '" + text + "'");
    }
    return std::chrono::milliseconds(std::stol(text));
}

std::vector<std::filesystem::path> config_search_paths(const std::filesystem::path& images_dir) {
    // The global directory lets several containers share one file.
    return {
        images_dir / kConfigFileName,
        std::filesystem::path(kGlobalConfigDir) / kConfigFileName,
    };
}

ClientConfig parse_config(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw ConfigError("Failed to parse config: top level must be an object");
    }

    ClientConfig config;

    auto id_it = root.find(kKeyId);
    if (id_it == root.end()) {
        throw ConfigError("Failed to parse config: ID missing in config file");
    }
    config.id = value_as_string(*id_it, kKeyId);
    if (config.id.empty()) {
        throw ConfigError("Failed to parse config: ID missing in config file");
    }

    if (auto it = root.find(kKeyDependencies); it != root.end()) {
        if (it->is_object()) {
            try {
                config.dependency_map = codec::parse_dependency_map(*it);
            } catch (const std::invalid_argument& exc) {
                throw ConfigError(std::string("Failed to parse config: ") + exc.what());
            }
        } else {
            config.dependencies = value_as_string(*it, kKeyDependencies);
        }
    }
    if (auto it = root.find(kKeyAddress); it != root.end()) {
        config.address = value_as_string(*it, kKeyAddress);
    }
    if (auto it = root.find(kKeyPort); it != root.end()) {
        config.port = parse_port(value_as_string(*it, kKeyPort));
    }
    if (auto it = root.find(kKeyLogFile); it != root.end()) {
        config.log_file = value_as_string(*it, kKeyLogFile);
    }
    if (auto it = root.find(kKeyTimeout); it != root.end()) {
        config.receive_timeout = parse_timeout_ms(value_as_string(*it, kKeyTimeout));
    }

    return config;
}

ClientConfig load_config_file(const std::filesystem::path& images_dir) {
    return load_config_file(images_dir, config_search_paths(images_dir));
}

ClientConfig load_config_file(const std::filesystem::path& images_dir,
                              const std::vector<std::filesystem::path>& search_paths) {
    for (const auto& candidate : search_paths) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }

        LOG4CPLUS_INFO(config_logger(), "Loading configuration from " << candidate.string());
        return parse_config(read_json_file(candidate));
    }

    LOG4CPLUS_ERROR(config_logger(), "No " << kConfigFileName << " found for " << images_dir.string());
    throw ConfigError("Configuration error: could not find config file in " + images_dir.string() + " or " +
                      kGlobalConfigDir);
}

codec::DependencyMap load_dependency_file(const std::filesystem::path& path) {
    auto root = read_json_file(path);
    try {
        return codec::parse_dependency_map(root);
    } catch (const std::invalid_argument& exc) {
        throw ConfigError("Invalid dependency file " + path.string() + ": " + exc.what());
    }
}

} // namespace coord::config
