#include "action_registry.hpp"

#include <algorithm>
#include <utility>

namespace coord::actions {

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        return;
    }
    handlers_.emplace(handler->name(), std::move(handler));
}

ActionHandler* ActionRegistry::find(const std::string& action) {
    auto it = handlers_.find(action);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> ActionRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace coord::actions
