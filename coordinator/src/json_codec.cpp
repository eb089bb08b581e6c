#include "json_codec.hpp"

#include "protocol.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace coord::codec {

std::string encode_envelope(const Envelope& envelope) {
    nlohmann::ordered_json root;
    root["id"] = envelope.id;
    root["action"] = envelope.action;
    root["dependencies"] = envelope.dependencies;
    return root.dump();
}

Envelope decode_envelope(const std::string& bytes) {
    auto root = nlohmann::ordered_json::parse(bytes);
    if (!root.is_object()) {
        throw std::invalid_argument("envelope is not a JSON object");
    }

    auto id_it = root.find("id");
    if (id_it == root.end() || !id_it->is_string()) {
        throw std::invalid_argument("envelope has no string 'id'");
    }
    auto action_it = root.find("action");
    if (action_it == root.end() || !action_it->is_string()) {
        throw std::invalid_argument("envelope has no string 'action'");
    }

    Envelope envelope;
    envelope.id = id_it->get<std::string>();
    envelope.action = action_it->get<std::string>();
    if (auto deps_it = root.find("dependencies"); deps_it != root.end()) {
        envelope.dependencies = *deps_it;
    }
    return envelope;
}

Envelope make_add_dependencies(const DependencyMap& dependencies) {
    Envelope envelope;
    envelope.id = kRegistrarId;
    envelope.action = kActionAddDependencies;
    envelope.dependencies = nlohmann::ordered_json::object();
    for (const auto& [component, linked] : dependencies) {
        envelope.dependencies[component] = linked;
    }
    return envelope;
}

Envelope make_action(const std::string& id, const std::string& action, const std::string& dependencies) {
    Envelope envelope;
    envelope.id = id;
    envelope.action = action;
    envelope.dependencies = dependencies;
    return envelope;
}

DependencyMap default_dependency_map() {
    return full_mesh({"c1", "c2", "c3"});
}

DependencyMap full_mesh(const std::vector<std::string>& components) {
    std::vector<std::string> unique;
    for (const auto& component : components) {
        if (component.empty()) {
            continue;
        }
        if (std::find(unique.begin(), unique.end(), component) == unique.end()) {
            unique.push_back(component);
        }
    }

    DependencyMap map;
    for (const auto& component : unique) {
        auto& linked = map[component];
        for (const auto& other : unique) {
            if (other != component) {
                linked.push_back(other);
            }
        }
    }
    return map;
}

DependencyMap parse_dependency_map(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw std::invalid_argument("dependencies must be a JSON object");
    }

    DependencyMap map;
    for (const auto& [component, linked] : object.items()) {
        if (!linked.is_array()) {
            throw std::invalid_argument("dependencies of '" + component + "' must be an array");
        }
        auto& entry = map[component];
        for (const auto& name : linked) {
            if (!name.is_string()) {
                throw std::invalid_argument("dependencies of '" + component + "' must be strings");
            }
            auto value = name.get<std::string>();
            // The coordinator ignores self edges.
            if (value != component) {
                entry.push_back(std::move(value));
            }
        }
    }
    return map;
}

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (start <= text.size()) {
        auto end = text.find(separator, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            parts.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

std::vector<std::string> split_dependencies(const std::string& colon_list) {
    return split_list(colon_list, ':');
}

std::string printable_bytes(const std::string& bytes) {
    // Single quotes unless the bytes hold a single quote and no double quote.
    char quote = '\'';
    if (bytes.find('\'') != std::string::npos && bytes.find('"') == std::string::npos) {
        quote = '"';
    }

    std::string out;
    out.reserve(bytes.size() + 3);
    out.push_back('b');
    out.push_back(quote);
    for (unsigned char c : bytes) {
        if (c == quote || c == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
            continue;
        }
        switch (c) {
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c < 0x20 || c >= 0x7f) {
                    char hex[5] = {0};
                    std::snprintf(hex, sizeof(hex), "\\x%02x", c);
                    out += hex;
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    out.push_back(quote);
    return out;
}

} // namespace coord::codec
