#pragma once

#include "../plugin_context.hpp"
#include "../protocol.hpp"

#include <string>

namespace stavily::actions {

/**
 * Resolve and run one request against a plugin.
 *
 * Rejections are checked in a fixed order: UnsupportedAction (unknown name),
 * CapabilityMissing (descriptor lacks the capability), InvalidState (state
 * forbids it). The lifecycle only advances when the handler succeeds.
 */
ResponseEnvelope dispatch(const RequestEnvelope& request, PluginContext& context);

/// Decode one request line, dispatch it and encode the response line.
std::string handle_action(const std::string& request_line, PluginContext& context);

} // namespace stavily::actions
