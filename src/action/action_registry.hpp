#pragma once

#include "action_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace stavily::actions {

class ActionRegistry {
public:
    void add(std::unique_ptr<ActionHandler> handler);
    ActionHandler* find(const std::string& action) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ActionHandler>> handlers_;
};

void register_lifecycle_actions(ActionRegistry& registry);
void register_report_actions(ActionRegistry& registry);
void register_capability_actions(ActionRegistry& registry);

} // namespace stavily::actions
