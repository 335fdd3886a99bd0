#pragma once

#include "../plugin_context.hpp"
#include "../protocol.hpp"

#include <optional>
#include <string>

namespace stavily::actions {

struct ActionContext {
	const RequestEnvelope& request;
	PluginContext& context;
};

class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual Action action() const = 0;

	const char* name() const { return action_name(action()); }

	/// Capability the plugin descriptor must declare, none for base actions.
	virtual std::optional<Capability> capability() const { return required_capability(action()); }

	/// Whether an unexpected exception moves the plugin to Failed.
	virtual bool fault_is_fatal() const { return true; }

	/// Returns the response data. Throws PluginError for recoverable failures.
	virtual Json handle(ActionContext& ctx) = 0;

protected:
	TriggerCapable& trigger_capability(const ActionContext& ctx) const;
	ActionCapable& action_capability(const ActionContext& ctx) const;
};

} // namespace stavily::actions
