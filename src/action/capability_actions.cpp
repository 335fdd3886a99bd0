#include "action_base.hpp"
#include "action_registry.hpp"

#include "../errors.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <chrono>

namespace stavily::actions {

class DetectTriggersAction final : public ActionHandler {
public:
    Action action() const override { return Action::DetectTriggers; }

    Json handle(ActionContext& ctx) override {
        auto events = trigger_capability(ctx).detect_triggers();

        Json result = Json::array();
        for (const auto& event : events) {
            result.push_back(to_json(event));
        }
        if (!events.empty()) {
            LOG4CPLUS_INFO(plugin_logger(), "detect_triggers: " << events.size() << " event(s)");
        }
        return result;
    }
};

class ExecuteAction final : public ActionHandler {
public:
    Action action() const override { return Action::ExecuteAction; }

    Json handle(ActionContext& ctx) override {
        if (!ctx.request.action_request) {
            throw PluginError::validation("execute_action requires 'action_request'");
        }
        const ActionRequest& incoming = *ctx.request.action_request;
        if (incoming.id.empty()) {
            throw PluginError::validation("'action_request.id' is required");
        }

        auto& executor = action_capability(ctx);
        ActionRequest request;
        request.id = incoming.id;
        request.parameters = executor.parameter_schema().apply(incoming.parameters);

        const auto& descriptor = ctx.context.plugin.descriptor();
        LOG4CPLUS_INFO(plugin_logger(), "execute_action id=" << request.id << " plugin=" << descriptor.id);

        auto wall_start = std::chrono::system_clock::now();
        auto start = std::chrono::steady_clock::now();
        ActionResult result = executor.execute_action(request);
        auto elapsed = std::chrono::steady_clock::now() - start;

        // The correlation id is echoed unchanged whatever the plugin returned
        result.id = incoming.id;
        if (result.started_at.empty()) {
            result.started_at = format_timestamp(wall_start);
        }
        if (result.completed_at.empty()) {
            result.completed_at = now_iso();
        }
        if (result.duration <= 0.0) {
            result.duration = std::chrono::duration<double>(elapsed).count();
        }
        if (!result.metadata.contains("plugin_id")) {
            result.metadata["plugin_id"] = descriptor.id;
            result.metadata["plugin_version"] = descriptor.version;
        }

        LOG4CPLUS_INFO(plugin_logger(), "execute_action id=" << result.id << " status=" << result.status);
        return to_json(result);
    }
};

void register_capability_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<DetectTriggersAction>());
    registry.add(std::make_unique<ExecuteAction>());
}

} // namespace stavily::actions
