#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stavily {

using Json = nlohmann::json;

enum class Action {
    GetInfo,
    Initialize,
    Start,
    Stop,
    GetStatus,
    GetHealth,
    DetectTriggers,
    GetTriggerConfig,
    ExecuteAction,
    GetActionConfig,
};

enum class Capability {
    Trigger,
    Action,
};

using CapabilitySet = std::set<Capability>;

enum class PluginState {
    Uninitialized,
    Initialized,
    Running,
    Stopped,
    Failed,
};

enum class ErrorKind {
    ProtocolError,
    ValidationError,
    CapabilityMissing,
    UnsupportedAction,
    InvalidState,
    TimeoutError,
    ProcessExitedError,
    InternalError,
};

struct ErrorInfo {
    ErrorKind kind = ErrorKind::InternalError;
    std::string message;
};

struct ActionRequest {
    std::string id;
    Json parameters = Json::object();
};

struct ActionResult {
    std::string id;
    std::string status;                 // plugin defined, "failed" on error
    std::optional<Json> output;
    std::optional<std::string> error;
    std::string started_at;
    std::string completed_at;
    double duration = 0.0;              // seconds
    Json metadata = Json::object();
};

struct RequestEnvelope {
    std::string action;                 // wire name, see action_name()
    std::optional<Json> config;
    std::optional<ActionRequest> action_request;
};

struct ResponseEnvelope {
    bool success = false;
    Json data;                          // null when absent
    std::optional<ErrorInfo> error;

    static ResponseEnvelope ok(Json data = nullptr);
    static ResponseEnvelope failure(ErrorKind kind, std::string message);
};

struct PluginDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::string version;
    std::string author;
    CapabilitySet capabilities;
    std::vector<std::string> tags;

    bool has(Capability capability) const { return capabilities.count(capability) != 0; }
};

struct TriggerEvent {
    std::string id;
    std::string type;                   // e.g. "disk.space.warning"
    std::string severity;               // info, low, medium, high, critical
    std::string timestamp;
    std::string source;
    Json payload = Json::object();
    std::vector<std::string> tags;
};

// Wire names
const char* action_name(Action action);
std::optional<Action> parse_action(const std::string& name);
const char* capability_name(Capability capability);
std::optional<Capability> parse_capability(const std::string& name);
const char* state_name(PluginState state);
std::optional<PluginState> parse_state(const std::string& name);
const char* error_kind_name(ErrorKind kind);
std::optional<ErrorKind> parse_error_kind(const std::string& name);

/// Actions that may run in any lifecycle state and never mutate it.
bool is_state_independent(Action action);

/// Capability an action requires, if any.
std::optional<Capability> required_capability(Action action);

/// "trigger", "action" or "trigger+action".
std::string plugin_type(const CapabilitySet& capabilities);

std::string format_timestamp(std::chrono::system_clock::time_point tp);
std::string now_iso();

Json to_json(const ErrorInfo& error);
Json to_json(const PluginDescriptor& descriptor);
Json to_json(const TriggerEvent& event);
Json to_json(const ActionResult& result);
Json to_json(const ActionRequest& request);

} // namespace stavily
