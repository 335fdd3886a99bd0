#pragma once

#include "environment.hpp"
#include "health.hpp"
#include "protocol.hpp"
#include "schema.hpp"

#include <chrono>
#include <vector>

namespace stavily {

/**
 * Base class of every plugin. The runtime owns lifecycle state and
 * configuration (see PluginContext); a plugin only supplies the hooks.
 *
 * A plugin declares its capabilities in descriptor() and additionally derives
 * from TriggerCapable and/or ActionCapable to implement them.
 */
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual const PluginDescriptor& descriptor() const = 0;

    /// Schema of the configuration accepted by initialize.
    virtual ConfigSchema config_schema() const { return ConfigSchema(); }

    /// Receives the configuration with defaults applied. Throw
    /// PluginError::validation() to reject it.
    virtual void on_initialize(const Json& config, const RuntimeOptions& options) {
        (void)config;
        (void)options;
    }

    /// Acquire resources. Throwing keeps the plugin Initialized.
    virtual void on_start() {}

    /// Release resources; also called when nothing was acquired. Throwing
    /// moves the plugin to Failed.
    virtual void on_stop() {}

    /// Add sub-checks and metrics. Must not have side effects.
    virtual void collect_health(HealthReporter& reporter) const { (void)reporter; }
};

class TriggerCapable {
public:
    virtual ~TriggerCapable() = default;

    /// Currently observed events, possibly none.
    virtual std::vector<TriggerEvent> detect_triggers() = 0;
};

class ActionCapable {
public:
    virtual ~ActionCapable() = default;

    /// Schema of ActionRequest::parameters.
    virtual ConfigSchema parameter_schema() const = 0;

    /// Parameters arrive validated with defaults applied.
    virtual ActionResult execute_action(const ActionRequest& request) = 0;

    /// Hint for the host's execute_action timeout.
    virtual std::chrono::seconds suggested_timeout() const { return std::chrono::seconds(60); }
};

} // namespace stavily
