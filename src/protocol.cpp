#include "protocol.hpp"

#include <ctime>
#include <utility>

namespace stavily {

namespace {

const std::pair<Action, const char*> kActionNames[] = {
    {Action::GetInfo, "get_info"},
    {Action::Initialize, "initialize"},
    {Action::Start, "start"},
    {Action::Stop, "stop"},
    {Action::GetStatus, "get_status"},
    {Action::GetHealth, "get_health"},
    {Action::DetectTriggers, "detect_triggers"},
    {Action::GetTriggerConfig, "get_trigger_config"},
    {Action::ExecuteAction, "execute_action"},
    {Action::GetActionConfig, "get_action_config"},
};

const std::pair<PluginState, const char*> kStateNames[] = {
    {PluginState::Uninitialized, "uninitialized"},
    {PluginState::Initialized, "initialized"},
    {PluginState::Running, "running"},
    {PluginState::Stopped, "stopped"},
    {PluginState::Failed, "failed"},
};

const std::pair<ErrorKind, const char*> kErrorKindNames[] = {
    {ErrorKind::ProtocolError, "ProtocolError"},
    {ErrorKind::ValidationError, "ValidationError"},
    {ErrorKind::CapabilityMissing, "CapabilityMissing"},
    {ErrorKind::UnsupportedAction, "UnsupportedAction"},
    {ErrorKind::InvalidState, "InvalidState"},
    {ErrorKind::TimeoutError, "TimeoutError"},
    {ErrorKind::ProcessExitedError, "ProcessExitedError"},
    {ErrorKind::InternalError, "InternalError"},
};

template <typename Enum, size_t N>
const char* lookup_name(const std::pair<Enum, const char*> (&table)[N], Enum value) {
    for (const auto& entry : table) {
        if (entry.first == value) {
            return entry.second;
        }
    }
    return "unknown";
}

template <typename Enum, size_t N>
std::optional<Enum> lookup_value(const std::pair<Enum, const char*> (&table)[N], const std::string& name) {
    for (const auto& entry : table) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

} // namespace

ResponseEnvelope ResponseEnvelope::ok(Json data) {
    ResponseEnvelope response;
    response.success = true;
    response.data = std::move(data);
    return response;
}

ResponseEnvelope ResponseEnvelope::failure(ErrorKind kind, std::string message) {
    ResponseEnvelope response;
    response.success = false;
    response.error = ErrorInfo{kind, std::move(message)};
    return response;
}

const char* action_name(Action action) {
    return lookup_name(kActionNames, action);
}

std::optional<Action> parse_action(const std::string& name) {
    return lookup_value(kActionNames, name);
}

const char* capability_name(Capability capability) {
    return capability == Capability::Trigger ? "trigger" : "action";
}

std::optional<Capability> parse_capability(const std::string& name) {
    if (name == "trigger") {
        return Capability::Trigger;
    }
    if (name == "action") {
        return Capability::Action;
    }
    return std::nullopt;
}

const char* state_name(PluginState state) {
    return lookup_name(kStateNames, state);
}

std::optional<PluginState> parse_state(const std::string& name) {
    return lookup_value(kStateNames, name);
}

const char* error_kind_name(ErrorKind kind) {
    return lookup_name(kErrorKindNames, kind);
}

std::optional<ErrorKind> parse_error_kind(const std::string& name) {
    return lookup_value(kErrorKindNames, name);
}

bool is_state_independent(Action action) {
    switch (action) {
        case Action::GetInfo:
        case Action::GetStatus:
        case Action::GetHealth:
        case Action::GetTriggerConfig:
        case Action::GetActionConfig:
            return true;
        default:
            return false;
    }
}

std::optional<Capability> required_capability(Action action) {
    switch (action) {
        case Action::DetectTriggers:
        case Action::GetTriggerConfig:
            return Capability::Trigger;
        case Action::ExecuteAction:
        case Action::GetActionConfig:
            return Capability::Action;
        default:
            return std::nullopt;
    }
}

std::string plugin_type(const CapabilitySet& capabilities) {
    std::string type;
    for (Capability capability : capabilities) {
        if (!type.empty()) {
            type += "+";
        }
        type += capability_name(capability);
    }
    return type.empty() ? "base" : type;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::string now_iso() {
    return format_timestamp(std::chrono::system_clock::now());
}

Json to_json(const ErrorInfo& error) {
    return Json{{"kind", error_kind_name(error.kind)}, {"message", error.message}};
}

Json to_json(const PluginDescriptor& descriptor) {
    Json capabilities = Json::array();
    for (Capability capability : descriptor.capabilities) {
        capabilities.push_back(capability_name(capability));
    }
    return Json{
        {"id", descriptor.id},
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"version", descriptor.version},
        {"author", descriptor.author},
        {"type", plugin_type(descriptor.capabilities)},
        {"capabilities", capabilities},
        {"tags", descriptor.tags},
    };
}

Json to_json(const TriggerEvent& event) {
    return Json{
        {"id", event.id},
        {"type", event.type},
        {"severity", event.severity},
        {"timestamp", event.timestamp},
        {"source", event.source},
        {"payload", event.payload},
        {"tags", event.tags},
    };
}

Json to_json(const ActionResult& result) {
    Json json{
        {"id", result.id},
        {"status", result.status},
        {"started_at", result.started_at},
        {"completed_at", result.completed_at},
        {"duration", result.duration},
        {"metadata", result.metadata},
    };
    if (result.output) {
        json["output"] = *result.output;
    }
    if (result.error) {
        json["error"] = *result.error;
    }
    return json;
}

Json to_json(const ActionRequest& request) {
    return Json{{"id", request.id}, {"parameters", request.parameters}};
}

} // namespace stavily
