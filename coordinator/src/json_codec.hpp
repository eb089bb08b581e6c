#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace coord::codec {

using DependencyMap = std::map<std::string, std::vector<std::string>>;

/**
 * Command sent to the coordinator as the whole body of a connection.
 *
 * `dependencies` is an object of string arrays for add_dependencies and a
 * colon-separated string for the checkpoint actions.
 */
struct Envelope {
    std::string id;
    std::string action;
    nlohmann::ordered_json dependencies;
};

std::string encode_envelope(const Envelope& envelope);
Envelope decode_envelope(const std::string& bytes);

Envelope make_add_dependencies(const DependencyMap& dependencies);
Envelope make_action(const std::string& id, const std::string& action, const std::string& dependencies);

DependencyMap default_dependency_map();
DependencyMap full_mesh(const std::vector<std::string>& components);
DependencyMap parse_dependency_map(const nlohmann::json& object);

std::vector<std::string> split_dependencies(const std::string& colon_list);
std::vector<std::string> split_list(const std::string& text, char separator);

// Reply bytes written as a bytes literal (b'...'), safe to print on one line.
std::string printable_bytes(const std::string& bytes);

} // namespace coord::codec
