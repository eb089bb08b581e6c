#pragma once

#include "../client_config.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace coord::actions {

/**
 * Run the handler registered for `action`.
 *
 * Returns false for an unknown action or when the coordinator rejected the
 * command. Transport faults propagate as net::ConnectionError.
 */
bool run_action(const std::string& action, const config::ClientConfig& config, std::ostream& out);

bool has_action(const std::string& action);
std::vector<std::string> action_names();

} // namespace coord::actions
