#include "action_base.hpp"
#include "action_registry.hpp"

#include "../errors.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace stavily::actions {

class InitializeAction final : public ActionHandler {
public:
    Action action() const override { return Action::Initialize; }

    // Failure keeps the previous state
    bool fault_is_fatal() const override { return false; }

    Json handle(ActionContext& ctx) override {
        auto& context = ctx.context;
        Json config = ctx.request.config.value_or(Json::object());

        Json validated = context.plugin.config_schema().apply(config);
        context.plugin.on_initialize(validated, context.options);
        context.configuration = std::move(validated);

        LOG4CPLUS_INFO(plugin_logger(), context.plugin.descriptor().id
                                            << " initialized (demo_mode=" << std::boolalpha
                                            << context.options.demo_mode << ")");

        return Json{{"state", state_name(PluginState::Initialized)}, {"demo_mode", context.options.demo_mode}};
    }
};

class StartAction final : public ActionHandler {
public:
    Action action() const override { return Action::Start; }

    // Resources not acquired: stay Initialized
    bool fault_is_fatal() const override { return false; }

    Json handle(ActionContext& ctx) override {
        auto& context = ctx.context;
        if (context.lifecycle.state() == PluginState::Running) {
            LOG4CPLUS_WARN(plugin_logger(), context.plugin.descriptor().id << " is already running");
            return Json{{"state", state_name(PluginState::Running)}};
        }

        context.plugin.on_start();
        context.running_since = std::chrono::steady_clock::now();

        LOG4CPLUS_INFO(plugin_logger(), context.plugin.descriptor().id << " started");
        return Json{{"state", state_name(PluginState::Running)}};
    }
};

class StopAction final : public ActionHandler {
public:
    Action action() const override { return Action::Stop; }

    Json handle(ActionContext& ctx) override {
        auto& context = ctx.context;
        PluginState state = context.lifecycle.state();

        if (state == PluginState::Uninitialized || state == PluginState::Stopped) {
            LOG4CPLUS_DEBUG(plugin_logger(), "stop: nothing to release in state " << state_name(state));
            return Json{{"state", state_name(state)}};
        }

        // Running, Initialized, or Failed (best-effort cleanup)
        context.running_since.reset();
        context.plugin.on_stop();

        PluginState next = state == PluginState::Failed ? PluginState::Failed : PluginState::Stopped;
        LOG4CPLUS_INFO(plugin_logger(), context.plugin.descriptor().id << " stopped");
        return Json{{"state", state_name(next)}};
    }
};

void register_lifecycle_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<InitializeAction>());
    registry.add(std::make_unique<StartAction>());
    registry.add(std::make_unique<StopAction>());
}

} // namespace stavily::actions
