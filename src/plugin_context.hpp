#pragma once

#include "environment.hpp"
#include "lifecycle.hpp"
#include "plugin.hpp"
#include "protocol.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace stavily {

/**
 * Everything the runtime keeps for one plugin instance. Handlers receive it
 * explicitly; nothing lives in process globals, so several instances can
 * share a process.
 */
struct PluginContext {
    PluginContext(Plugin& plugin, RuntimeOptions options);

    Plugin& plugin;
    RuntimeOptions options;
    LifecycleStateMachine lifecycle;

    // Validated configuration of the last successful initialize
    Json configuration = Json::object();

    std::optional<std::chrono::steady_clock::time_point> running_since;
    uint64_t request_count = 0;
    uint64_t error_count = 0;

    // Held for the duration of each request
    std::mutex mutex;

    double uptime_seconds() const;
};

} // namespace stavily
