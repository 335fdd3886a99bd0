#include "action_registry.hpp"

#include <stdexcept>

namespace stavily::actions {

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        throw std::logic_error("null action handler");
    }

    std::string wire_name = handler->name();
    auto [it, inserted] = handlers_.emplace(wire_name, std::move(handler));
    if (!inserted) {
        throw std::logic_error("action '" + wire_name + "' registered twice");
    }
}

ActionHandler* ActionRegistry::find(const std::string& action) const {
    // Only the closed vocabulary of parse_action() is ever served
    if (!parse_action(action)) {
        return nullptr;
    }
    auto it = handlers_.find(action);
    return it == handlers_.end() ? nullptr : it->second.get();
}

} // namespace stavily::actions
