#include "action_base.hpp"
#include "action_registry.hpp"

#include "../health.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace stavily::actions {

class GetInfoAction final : public ActionHandler {
public:
    Action action() const override { return Action::GetInfo; }

    Json handle(ActionContext& ctx) override {
        Json info = to_json(ctx.context.plugin.descriptor());
        info["demo_mode"] = ctx.context.options.demo_mode;
        return info;
    }
};

class GetStatusAction final : public ActionHandler {
public:
    Action action() const override { return Action::GetStatus; }

    Json handle(ActionContext& ctx) override {
        const auto& context = ctx.context;
        auto last_error = context.lifecycle.last_error();
        return Json{
            {"state", state_name(context.lifecycle.state())},
            {"since", format_timestamp(context.lifecycle.since())},
            {"uptime", context.uptime_seconds()},
            {"demo_mode", context.options.demo_mode},
            {"requests", context.request_count},
            {"errors", context.error_count},
            {"last_error", last_error ? Json(*last_error) : Json(nullptr)},
        };
    }
};

/// Never fails: a throwing plugin hook becomes a failed sub-check.
class GetHealthAction final : public ActionHandler {
public:
    Action action() const override { return Action::GetHealth; }

    Json handle(ActionContext& ctx) override {
        const auto& context = ctx.context;
        HealthReporter reporter(context.options.health_freshness);

        try {
            context.plugin.collect_health(reporter);
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(plugin_logger(), "Health collection failed: " << exc.what());
            reporter.add_check("plugin", CheckResult::fail(exc.what()));
        }

        HealthReport report = reporter.build(context.lifecycle.state(), context.lifecycle.last_error(),
                                             context.uptime_seconds());
        report.metrics["demo_mode"] = context.options.demo_mode;
        report.metrics["requests"] = context.request_count;
        report.metrics["errors"] = context.error_count;
        return report.to_json();
    }
};

class GetTriggerConfigAction final : public ActionHandler {
public:
    Action action() const override { return Action::GetTriggerConfig; }

    Json handle(ActionContext& ctx) override {
        return ctx.context.plugin.config_schema().to_json();
    }
};

class GetActionConfigAction final : public ActionHandler {
public:
    Action action() const override { return Action::GetActionConfig; }

    Json handle(ActionContext& ctx) override {
        auto& executor = action_capability(ctx);
        Json config = executor.parameter_schema().to_json();
        config["config"] = ctx.context.plugin.config_schema().to_json();
        config["timeout"] = executor.suggested_timeout().count();
        return config;
    }
};

void register_report_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<GetInfoAction>());
    registry.add(std::make_unique<GetStatusAction>());
    registry.add(std::make_unique<GetHealthAction>());
    registry.add(std::make_unique<GetTriggerConfigAction>());
    registry.add(std::make_unique<GetActionConfigAction>());
}

} // namespace stavily::actions
