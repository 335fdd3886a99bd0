#pragma once

#include "plugin_client.hpp"
#include "plugin_process.hpp"

#include "../protocol.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stavily::host {

struct PluginEntry {
    std::string id;
    ProcessOptions process;
    Json config = Json::object();
    std::optional<ActionRequest> action_request;
};

struct HostConfig {
    std::optional<bool> demo_mode;      // unset: plugins read their own environment
    CallTimeouts timeouts;
    std::vector<PluginEntry> plugins;
};

/**
 * Load a host configuration file:
 *
 *   {"demo_mode": true,
 *    "timeouts": {"lifecycle_ms": 5000, "query_ms": 5000, "detect_ms": 30000, "execute_ms": 60000},
 *    "plugins": [{"id": "disk", "path": "./disk_space_monitor", "args": [], "env": {},
 *                 "workdir": "/tmp", "config": {}, "action_request": {"id": "...", "parameters": {}}}]}
 *
 * Throws std::runtime_error naming the file and the offending entry.
 */
HostConfig load_host_config(const std::string& path);

/// Same, from an already parsed document.
HostConfig parse_host_config(const Json& root);

/// Entry for a plugin given on the command line; the id is the file name.
PluginEntry plugin_entry_from_path(const std::string& path);

/// Apply demo_mode to a plugin's environment as STAVILY_DEMO_MODE.
void apply_demo_mode(PluginEntry& entry, bool demo_mode);

} // namespace stavily::host
