#pragma once

#include "../client_config.hpp"
#include "../json_codec.hpp"

#include <ostream>
#include <string>

namespace coord::actions {

struct ActionContext {
	const std::string& action;
	const config::ClientConfig& config;
	std::ostream& out;
};

class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual const char* name() const = 0;
	virtual bool handle(ActionContext& ctx) = 0;

protected:
	/// Send the envelope over one connection and return the raw reply.
	std::string send_envelope(const ActionContext& ctx, const codec::Envelope& envelope);
};

} // namespace coord::actions
