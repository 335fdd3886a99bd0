#include "plugin_host.hpp"

#include "../errors.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <optional>

namespace stavily::host {

namespace {

std::string failure_text(const ResponseEnvelope& response) {
    if (!response.error) {
        return "failed";
    }
    return std::string(error_kind_name(response.error->kind)) + ": " + response.error->message;
}

std::string describe(const std::exception& e) {
    if (const auto* host = dynamic_cast<const HostError*>(&e)) {
        return std::string(error_kind_name(host->kind())) + ": " + e.what();
    }
    if (const auto* plugin = dynamic_cast<const PluginError*>(&e)) {
        return std::string(error_kind_name(plugin->kind())) + ": " + e.what();
    }
    if (dynamic_cast<const ProtocolError*>(&e)) {
        return std::string("ProtocolError: ") + e.what();
    }
    return e.what();
}

std::string field(const Json& data, const char* key, const std::string& fallback = "") {
    const Json* value = codec::find_key(data, key);
    return value ? codec::as_string(*value, fallback) : fallback;
}

size_t schema_size(const Json& document) {
    const Json* schema = codec::find_key(document, "schema");
    return schema && schema->is_object() ? schema->size() : 0;
}

RequestEnvelope make_request(Action action) {
    RequestEnvelope request;
    request.action = action_name(action);
    return request;
}

enum class Stage {
    GetInfo,
    ConfigSchema,       // schema fetch behind the initialize step
    Initialize,
    Start,
    GetHealth,
    GetStatus,
    GetTriggerConfig,
    DetectTriggers,
    GetActionConfig,
    ExecuteAction,
    Stop,
    StopAgain,
    Done,
};

Stage next_stage(Stage stage) {
    return stage == Stage::Done ? Stage::Done : static_cast<Stage>(static_cast<int>(stage) + 1);
}

const char* step_name(Stage stage) {
    switch (stage) {
        case Stage::GetInfo: return "get_info";
        case Stage::ConfigSchema:
        case Stage::Initialize: return "initialize";
        case Stage::Start: return "start";
        case Stage::GetHealth: return "get_health";
        case Stage::GetStatus: return "get_status";
        case Stage::GetTriggerConfig: return "get_trigger_config";
        case Stage::DetectTriggers: return "detect_triggers";
        case Stage::GetActionConfig: return "get_action_config";
        case Stage::ExecuteAction: return "execute_action";
        case Stage::Stop:
        case Stage::StopAgain: return "stop";
        case Stage::Done: break;
    }
    return "done";
}

// One plugin's walk through the check, one outstanding request at a time.
class LifecycleCheck {
public:
    LifecycleCheck(const PluginEntry& entry, PluginClient& client, const PluginHost::StepObserver& observer)
        : entry_(entry), client_(client), observer_(observer) {
        report_.plugin = entry.id;
    }

    /// Issue the request of the current stage, skipping stages that do not apply.
    void advance();

    bool ready() const { return pending_ && pending_->ready(); }
    bool done() const { return stage_ == Stage::Done; }

    /// Collect the resolved response and move on to the next request.
    void complete();

    PluginReport take_report() { return std::move(report_); }

private:
    std::optional<RequestEnvelope> request_for(Stage stage);
    bool accept(Stage stage, const ResponseEnvelope& response);
    std::string summarize(Stage stage, const Json& data) const;
    void record(const std::string& step, bool ok, const std::string& detail);
    void fail(const std::string& detail);
    bool has(Capability capability) const { return descriptor_ && descriptor_->has(capability); }

    const PluginEntry& entry_;
    PluginClient& client_;
    const PluginHost::StepObserver& observer_;

    Stage stage_ = Stage::GetInfo;
    std::optional<PendingCall> pending_;
    std::optional<PluginDescriptor> descriptor_;
    Json validated_config_ = Json::object();
    Json action_schema_;
    PluginReport report_;
};

void LifecycleCheck::advance() {
    while (stage_ != Stage::Done) {
        std::optional<RequestEnvelope> request;
        try {
            request = request_for(stage_);
            if (request) {
                pending_ = client_.begin_call(std::move(*request));
                return;
            }
        } catch (const std::exception& e) {
            fail(describe(e));
            return;
        }
        stage_ = next_stage(stage_);
    }
    report_.passed = true;
}

void LifecycleCheck::complete() {
    PendingCall pending = std::move(*pending_);
    pending_.reset();

    try {
        ResponseEnvelope response = client_.finish_call(pending);
        if (!accept(stage_, response)) {
            return;
        }
    } catch (const std::exception& e) {
        fail(describe(e));
        return;
    }

    stage_ = next_stage(stage_);
    advance();
}

std::optional<RequestEnvelope> LifecycleCheck::request_for(Stage stage) {
    switch (stage) {
        case Stage::GetInfo:
            return make_request(Action::GetInfo);
        case Stage::ConfigSchema:
            if (has(Capability::Trigger)) {
                return make_request(Action::GetTriggerConfig);
            }
            if (has(Capability::Action)) {
                return make_request(Action::GetActionConfig);
            }
            // No capability exposes a schema query
            validated_config_ = entry_.config.is_null() ? Json::object() : entry_.config;
            return std::nullopt;
        case Stage::Initialize: {
            RequestEnvelope request = make_request(Action::Initialize);
            request.config = validated_config_;
            return request;
        }
        case Stage::Start:
            return make_request(Action::Start);
        case Stage::GetHealth:
            return make_request(Action::GetHealth);
        case Stage::GetStatus:
            return make_request(Action::GetStatus);
        case Stage::GetTriggerConfig:
            return has(Capability::Trigger) ? std::optional(make_request(Action::GetTriggerConfig)) : std::nullopt;
        case Stage::DetectTriggers:
            return has(Capability::Trigger) ? std::optional(make_request(Action::DetectTriggers)) : std::nullopt;
        case Stage::GetActionConfig:
            return has(Capability::Action) ? std::optional(make_request(Action::GetActionConfig)) : std::nullopt;
        case Stage::ExecuteAction: {
            if (!has(Capability::Action) || !entry_.action_request) {
                return std::nullopt;
            }
            RequestEnvelope request = make_request(Action::ExecuteAction);
            ActionRequest action_request = *entry_.action_request;
            action_request.parameters =
                apply_schema_document(entry_.id, action_schema_, action_request.parameters);
            request.action_request = std::move(action_request);
            return request;
        }
        case Stage::Stop:
        case Stage::StopAgain:
            return make_request(Action::Stop);
        case Stage::Done:
            break;
    }
    return std::nullopt;
}

bool LifecycleCheck::accept(Stage stage, const ResponseEnvelope& response) {
    if (!response.success) {
        fail(failure_text(response));
        return false;
    }

    switch (stage) {
        case Stage::GetInfo:
            descriptor_ = client_.descriptor();
            break;
        case Stage::ConfigSchema: {
            bool trigger = has(Capability::Trigger);
            Json document = trigger ? client_.schema_document(response, "get_trigger_config")
                                    : client_.schema_document(response, "get_action_config", "config");
            validated_config_ = apply_schema_document(entry_.id, document, entry_.config);
            // Internal to the initialize step: nothing is recorded
            return true;
        }
        case Stage::GetActionConfig:
            action_schema_ = client_.schema_document(response, "get_action_config");
            break;
        default:
            break;
    }

    record(step_name(stage), true, summarize(stage, response.data));
    return true;
}

std::string LifecycleCheck::summarize(Stage stage, const Json& data) const {
    switch (stage) {
        case Stage::GetInfo:
            return field(data, "name") + " " + field(data, "version") + " (" + field(data, "type") + ")";
        case Stage::GetHealth:
            return field(data, "status", "?");
        case Stage::GetTriggerConfig:
            return std::to_string(schema_size(data)) + " option(s)";
        case Stage::DetectTriggers:
            return std::to_string(data.is_array() ? data.size() : 0) + " event(s)";
        case Stage::GetActionConfig:
            return std::to_string(schema_size(data)) + " parameter(s)";
        case Stage::ExecuteAction:
            return field(data, "id") + " " + field(data, "status", "?");
        default:
            return field(data, "state", "?");
    }
}

void LifecycleCheck::record(const std::string& step, bool ok, const std::string& detail) {
    StepResult result{entry_.id, step, ok, detail};
    if (ok) {
        LOG4CPLUS_INFO(host_logger(), entry_.id << ": " << step << " ok " << detail);
    } else {
        LOG4CPLUS_ERROR(host_logger(), entry_.id << ": " << step << " failed: " << detail);
    }
    if (observer_) {
        observer_(result);
    }
    report_.steps.push_back(std::move(result));
}

void LifecycleCheck::fail(const std::string& detail) {
    record(step_name(stage_), false, detail);
    report_.passed = false;
    stage_ = Stage::Done;
}

} // namespace

PluginHost::PluginHost(HostConfig config) : config_(std::move(config)) {
    entries_ = config_.plugins;
    for (auto& entry : entries_) {
        if (config_.demo_mode) {
            apply_demo_mode(entry, *config_.demo_mode);
        }
        clients_.push_back(std::make_unique<PluginClient>(entry.id, entry.process, reactor_, config_.timeouts));
    }
}

PluginHost::~PluginHost() {
    shutdown();
}

bool PluginHost::start() {
    reactor_.set_listener([this] {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        woken_ = true;
        wake_cv_.notify_one();
    });
    return reactor_.start();
}

void PluginHost::shutdown() {
    for (auto& client : clients_) {
        client->shutdown();
    }
    reactor_.stop();
}

PluginClient* PluginHost::client(const std::string& id) {
    for (auto& client : clients_) {
        if (client->instance_id() == id) {
            return client.get();
        }
    }
    return nullptr;
}

void PluginHost::wait_for_completion(std::chrono::milliseconds limit) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, limit, [this] { return woken_; });
    woken_ = false;
}

std::vector<PluginReport> PluginHost::run_lifecycle_check(const StepObserver& observer) {
    std::vector<LifecycleCheck> checks;
    checks.reserve(clients_.size());
    for (size_t i = 0; i < clients_.size(); ++i) {
        checks.emplace_back(entries_[i], *clients_[i], observer);
    }
    for (auto& check : checks) {
        check.advance();
    }

    size_t remaining = checks.size();
    while (remaining > 0) {
        // The limit only bounds a missed wake-up; deadlines are the reactor's
        wait_for_completion(std::chrono::milliseconds(200));

        remaining = 0;
        for (auto& check : checks) {
            while (check.ready()) {
                check.complete();
            }
            if (!check.done()) {
                ++remaining;
            }
        }
    }

    std::vector<PluginReport> reports;
    reports.reserve(checks.size());
    for (size_t i = 0; i < checks.size(); ++i) {
        reports.push_back(checks[i].take_report());
        clients_[i]->shutdown();
    }
    return reports;
}

} // namespace stavily::host
