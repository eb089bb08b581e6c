#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"
#include "../protocol.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>
#include <string>

namespace coord::actions {

namespace {

// Registers the dependency map of a workload under the registrar identity.
// The reply is printed as received and never interpreted.
class AddDependenciesAction final : public ActionHandler {
public:
	const char* name() const override { return kActionAddDependencies; }

	bool handle(ActionContext& ctx) override {
		for (const auto& [component, linked] : ctx.config.dependency_map) {
			std::string joined;
			for (const auto& name : linked) {
				joined += joined.empty() ? name : ", " + name;
			}
			LOG4CPLUS_INFO(client_logger(), "[" << kRegistrarId << "] " << component << " => " << joined);
		}

		auto envelope = codec::make_add_dependencies(ctx.config.dependency_map);
		std::string response = send_envelope(ctx, envelope);

		ctx.out << "Received " << codec::printable_bytes(response) << std::endl;
		return true;
	}
};

} // namespace

void register_dependency_actions(ActionRegistry& registry) {
	registry.add(std::make_unique<AddDependenciesAction>());
}

} // namespace coord::actions
