#include "host_config.hpp"

#include "../environment.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

namespace stavily::host {

namespace {

std::chrono::milliseconds read_timeout(const Json& timeouts, const char* key, std::chrono::milliseconds fallback) {
    const Json* value = codec::find_key(timeouts, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number_integer() || value->get<int64_t>() <= 0) {
        throw std::runtime_error(std::string("timeouts.") + key + " must be a positive integer");
    }
    return std::chrono::milliseconds(value->get<int64_t>());
}

PluginEntry parse_plugin(const Json& item, size_t index) {
    std::string where = "plugins[" + std::to_string(index) + "]";
    if (!item.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }

    const Json* path = codec::find_key(item, "path");
    if (!path || !path->is_string() || path->get<std::string>().empty()) {
        throw std::runtime_error(where + ".path must be a non-empty string");
    }

    PluginEntry entry = plugin_entry_from_path(path->get<std::string>());
    if (const Json* id = codec::find_key(item, "id")) {
        if (!id->is_string() || id->get<std::string>().empty()) {
            throw std::runtime_error(where + ".id must be a non-empty string");
        }
        entry.id = id->get<std::string>();
    }

    if (const Json* args = codec::find_key(item, "args")) {
        if (!args->is_array()) {
            throw std::runtime_error(where + ".args must be an array of strings");
        }
        for (const auto& arg : *args) {
            if (!arg.is_string()) {
                throw std::runtime_error(where + ".args must be an array of strings");
            }
            entry.process.args.push_back(arg.get<std::string>());
        }
    }

    if (const Json* env = codec::find_key(item, "env")) {
        if (!env->is_object()) {
            throw std::runtime_error(where + ".env must be an object of strings");
        }
        for (auto it = env->begin(); it != env->end(); ++it) {
            if (!it.value().is_string()) {
                throw std::runtime_error(where + ".env." + it.key() + " must be a string");
            }
            entry.process.env[it.key()] = it.value().get<std::string>();
        }
    }

    if (const Json* workdir = codec::find_key(item, "workdir")) {
        if (!workdir->is_string()) {
            throw std::runtime_error(where + ".workdir must be a string");
        }
        entry.process.workdir = workdir->get<std::string>();
    }

    if (const Json* config = codec::find_key(item, "config")) {
        if (!config->is_object()) {
            throw std::runtime_error(where + ".config must be an object");
        }
        entry.config = *config;
    }

    if (const Json* request = codec::find_key(item, "action_request")) {
        if (!request->is_object()) {
            throw std::runtime_error(where + ".action_request must be an object");
        }
        ActionRequest action_request;
        action_request.id = codec::as_string(request->value("id", Json()), "");
        if (action_request.id.empty()) {
            throw std::runtime_error(where + ".action_request.id must be a non-empty string");
        }
        if (const Json* parameters = codec::find_key(*request, "parameters")) {
            if (!parameters->is_object()) {
                throw std::runtime_error(where + ".action_request.parameters must be an object");
            }
            action_request.parameters = *parameters;
        }
        entry.action_request = std::move(action_request);
    }

    return entry;
}

} // namespace

PluginEntry plugin_entry_from_path(const std::string& path) {
    PluginEntry entry;
    entry.id = std::filesystem::path(path).filename().string();
    entry.process.executable = path;
    return entry;
}

void apply_demo_mode(PluginEntry& entry, bool demo_mode) {
    entry.process.env[kDemoModeEnv] = demo_mode ? "true" : "false";
}

HostConfig parse_host_config(const Json& root) {
    if (!root.is_object()) {
        throw std::runtime_error("host configuration must be a JSON object");
    }

    HostConfig config;
    if (const Json* demo = codec::find_key(root, "demo_mode")) {
        if (!demo->is_boolean()) {
            throw std::runtime_error("demo_mode must be a boolean");
        }
        config.demo_mode = demo->get<bool>();
    }

    if (const Json* timeouts = codec::find_key(root, "timeouts")) {
        if (!timeouts->is_object()) {
            throw std::runtime_error("timeouts must be an object");
        }
        config.timeouts.lifecycle = read_timeout(*timeouts, "lifecycle_ms", config.timeouts.lifecycle);
        config.timeouts.query = read_timeout(*timeouts, "query_ms", config.timeouts.query);
        config.timeouts.detect = read_timeout(*timeouts, "detect_ms", config.timeouts.detect);
        config.timeouts.execute = read_timeout(*timeouts, "execute_ms", config.timeouts.execute);
    }

    if (const Json* plugins = codec::find_key(root, "plugins")) {
        if (!plugins->is_array()) {
            throw std::runtime_error("plugins must be an array");
        }
        std::set<std::string> ids;
        for (size_t i = 0; i < plugins->size(); ++i) {
            PluginEntry entry = parse_plugin((*plugins)[i], i);
            if (!ids.insert(entry.id).second) {
                throw std::runtime_error("duplicate plugin id '" + entry.id + "'");
            }
            config.plugins.push_back(std::move(entry));
        }
    }

    return config;
}

HostConfig load_host_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open host configuration " + path);
    }

    Json root;
    try {
        in >> root;
    } catch (const Json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }

    try {
        HostConfig config = parse_host_config(root);
        LOG4CPLUS_INFO(host_logger(), "Loaded " << config.plugins.size() << " plugin(s) from " << path);
        return config;
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

} // namespace stavily::host
