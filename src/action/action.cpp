#include "action.hpp"

#include "action_base.hpp"
#include "action_registry.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace stavily::actions {

namespace {

const ActionRegistry& get_registry() {
	static const ActionRegistry registry = [] {
		ActionRegistry reg;
		register_lifecycle_actions(reg);
		register_report_actions(reg);
		register_capability_actions(reg);
		return reg;
	}();

	return registry;
}

ResponseEnvelope reject(PluginContext& context, ErrorKind kind, const std::string& message) {
	++context.error_count;
	LOG4CPLUS_WARN(plugin_logger(), error_kind_name(kind) << ": " << message);
	return ResponseEnvelope::failure(kind, message);
}

ResponseEnvelope fault(const ActionHandler& handler, PluginContext& context, const std::string& message) {
	++context.error_count;
	std::string detail = std::string(handler.name()) + ": " + message;
	if (handler.fault_is_fatal()) {
		LOG4CPLUS_ERROR(plugin_logger(), "Internal error, plugin failed: " << detail);
		context.lifecycle.fail(detail);
		context.running_since.reset();
	} else {
		LOG4CPLUS_ERROR(plugin_logger(), "Internal error: " << detail);
		context.lifecycle.record_error(detail);
	}
	return ResponseEnvelope::failure(ErrorKind::InternalError, detail);
}

} // namespace

TriggerCapable& ActionHandler::trigger_capability(const ActionContext& ctx) const {
	auto* trigger = dynamic_cast<TriggerCapable*>(&ctx.context.plugin);
	if (!trigger) {
		throw PluginError::internal("plugin declares the trigger capability but does not implement it");
	}
	return *trigger;
}

ActionCapable& ActionHandler::action_capability(const ActionContext& ctx) const {
	auto* executor = dynamic_cast<ActionCapable*>(&ctx.context.plugin);
	if (!executor) {
		throw PluginError::internal("plugin declares the action capability but does not implement it");
	}
	return *executor;
}

ResponseEnvelope dispatch(const RequestEnvelope& request, PluginContext& context) {
	std::lock_guard<std::mutex> lock(context.mutex);
	++context.request_count;

	ActionHandler* handler = get_registry().find(request.action);
	if (!handler) {
		return reject(context, ErrorKind::UnsupportedAction, "Unknown action: " + request.action);
	}

	const auto& descriptor = context.plugin.descriptor();
	if (auto capability = handler->capability(); capability && !descriptor.has(*capability)) {
		return reject(context, ErrorKind::CapabilityMissing,
		              std::string(handler->name()) + " requires a " + capability_name(*capability) +
		                  " plugin; " + descriptor.id + " is " + plugin_type(descriptor.capabilities));
	}

	PluginState state = context.lifecycle.state();
	if (!context.lifecycle.permits(handler->action())) {
		return reject(context, ErrorKind::InvalidState,
		              std::string(handler->name()) + " is not allowed in state " + state_name(state));
	}

	LOG4CPLUS_DEBUG(plugin_logger(), "Action: " << handler->name() << " state=" << state_name(state));

	ActionContext ctx{request, context};
	try {
		Json data = handler->handle(ctx);
		PluginState next = context.lifecycle.commit(handler->action());
		if (next != state) {
			LOG4CPLUS_INFO(plugin_logger(), handler->name() << ": " << state_name(state) << " -> " << state_name(next));
		}
		return ResponseEnvelope::ok(std::move(data));
	} catch (const PluginError& exc) {
		if (exc.kind() == ErrorKind::InternalError) {
			return fault(*handler, context, exc.what());
		}
		context.lifecycle.record_error(std::string(handler->name()) + ": " + exc.what());
		return reject(context, exc.kind(), exc.what());
	} catch (const std::exception& exc) {
		return fault(*handler, context, exc.what());
	}
}

std::string handle_action(const std::string& request_line, PluginContext& context) {
	RequestEnvelope request;
	try {
		request = codec::decode_request(request_line);
	} catch (const ProtocolError& exc) {
		LOG4CPLUS_ERROR(core_logger(), "Decode error: " << exc.what());
		{
			std::lock_guard<std::mutex> lock(context.mutex);
			++context.request_count;
			++context.error_count;
		}
		return codec::encode_response(ResponseEnvelope::failure(ErrorKind::ProtocolError, exc.what()));
	}

	ResponseEnvelope response = dispatch(request, context);
	try {
		return codec::encode_response_checked(response);
	} catch (const ProtocolError& exc) {
		// The handler already ran: its output is lost, which is an internal fault
		std::lock_guard<std::mutex> lock(context.mutex);
		if (ActionHandler* handler = get_registry().find(request.action)) {
			return codec::encode_response(fault(*handler, context, exc.what()));
		}
		return codec::encode_response(reject(context, ErrorKind::InternalError, exc.what()));
	}
}

} // namespace stavily::actions
