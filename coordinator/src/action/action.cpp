#include "action.hpp"

#include "action_base.hpp"
#include "action_registry.hpp"
#include "../logger.hpp"
#include "../tcp_client.hpp"

#include <log4cplus/loggingmacros.h>

namespace coord::actions {

namespace {

ActionRegistry& get_registry() {
	static ActionRegistry registry = [] {
		ActionRegistry reg;
		register_dependency_actions(reg);
		register_checkpoint_actions(reg);
		return reg;
	}();

	return registry;
}

} // namespace

std::string ActionHandler::send_envelope(const ActionContext& ctx, const codec::Envelope& envelope) {
	const auto endpoint = ctx.config.endpoint();
	LOG4CPLUS_INFO(client_logger(), "Connecting to " << endpoint.address << ":" << endpoint.port
	                                                 << " using action " << envelope.action);

	std::string payload = codec::encode_envelope(envelope);
	LOG4CPLUS_DEBUG(client_logger(), "[" << envelope.id << "] [<<] " << payload);

	std::string response = net::exchange(endpoint, payload);
	LOG4CPLUS_INFO(client_logger(), "[" << envelope.id << "] [>>] Server responded with: "
	                                    << codec::printable_bytes(response));
	return response;
}

bool run_action(const std::string& action, const config::ClientConfig& config, std::ostream& out) {
	ActionHandler* handler = get_registry().find(action);
	if (!handler) {
		LOG4CPLUS_WARN(core_logger(), "Unknown action: " << action);
		return false;
	}

	LOG4CPLUS_INFO(core_logger(), "Action: " << action << " id=" << config.id);
	ActionContext ctx{action, config, out};
	return handler->handle(ctx);
}

bool has_action(const std::string& action) {
	return get_registry().find(action) != nullptr;
}

std::vector<std::string> action_names() {
	return get_registry().names();
}

} // namespace coord::actions
