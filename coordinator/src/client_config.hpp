#pragma once

#include "json_codec.hpp"
#include "protocol.hpp"
#include "tcp_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace coord::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Parameters of one client invocation.
 * Filled from defaults, criu-coordinator.json or the command line.
 */
struct ClientConfig {
    std::string id;
    std::string dependencies;   // colon-separated ids for the checkpoint actions
    std::string address = kDefaultAddress;
    uint16_t port = kDefaultPort;
    std::string log_file = "-";
    std::chrono::milliseconds receive_timeout{0};
    codec::DependencyMap dependency_map = codec::default_dependency_map();

    net::Endpoint endpoint() const {
        return net::Endpoint{address, port, receive_timeout};
    }
};

uint16_t parse_port(const std::string& text);
std::chrono::milliseconds parse_timeout_ms(const std::string& text);

std::vector<std::filesystem::path> config_search_paths(const std::filesystem::path& images_dir);

ClientConfig parse_config(const nlohmann::json& root);

ClientConfig load_config_file(const std::filesystem::path& images_dir);
ClientConfig load_config_file(const std::filesystem::path& images_dir,
                              const std::vector<std::filesystem::path>& search_paths);

codec::DependencyMap load_dependency_file(const std::filesystem::path& path);

} // namespace coord::config
