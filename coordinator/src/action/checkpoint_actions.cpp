#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"
#include "../protocol.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>
#include <string>

namespace coord::actions {

namespace {

// One stage of a coordinated checkpoint/restore. The coordinator holds the
// reply until every dependency reached the same stage, then answers ACK or an
// error message.
class CheckpointAction final : public ActionHandler {
public:
	explicit CheckpointAction(const char* name) : name_(name) {}

	const char* name() const override { return name_; }

	bool handle(ActionContext& ctx) override {
		if (ctx.config.id.empty()) {
			LOG4CPLUS_ERROR(client_logger(), ctx.action << ": client id is required");
			throw config::ConfigError("client id is required for action " + ctx.action);
		}

		for (const auto& dependency : codec::split_dependencies(ctx.config.dependencies)) {
			LOG4CPLUS_INFO(client_logger(), "[" << ctx.config.id << "] [==] Depends on " << dependency);
		}

		auto envelope = codec::make_action(ctx.config.id, name_, ctx.config.dependencies);
		std::string response = send_envelope(ctx, envelope);

		if (response != kMessageAck) {
			LOG4CPLUS_ERROR(client_logger(), "[" << ctx.config.id << "] [!!] Server didn't acknowledge the request: "
			                                     << codec::printable_bytes(response));
			ctx.out << ctx.config.id << ": " << name_ << " rejected: " << response << std::endl;
			return false;
		}

		ctx.out << ctx.config.id << ": " << name_ << " " << kMessageAck << std::endl;
		return true;
	}

private:
	const char* name_;
};

} // namespace

void register_checkpoint_actions(ActionRegistry& registry) {
	for (const char* stage : {kActionPreDump, kActionPostDump, kActionPreRestore, kActionPostRestore}) {
		registry.add(std::make_unique<CheckpointAction>(stage));
	}
}

} // namespace coord::actions
