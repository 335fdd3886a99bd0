#include "plugin_client.hpp"

#include "../errors.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../schema.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstdint>
#include <stdexcept>

namespace stavily::host {

namespace {

class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_ = false; }

private:
    std::atomic<bool>& flag_;
};

RequestEnvelope make_request(Action action) {
    RequestEnvelope request;
    request.action = action_name(action);
    return request;
}

} // namespace

std::chrono::milliseconds CallTimeouts::for_action(const std::string& action) const {
    auto parsed = parse_action(action);
    if (!parsed) {
        return query;
    }
    switch (*parsed) {
        case Action::Initialize:
        case Action::Start:
        case Action::Stop:
            return lifecycle;
        case Action::DetectTriggers:
            return detect;
        case Action::ExecuteAction:
            return execute;
        default:
            return query;
    }
}

Json apply_schema_document(const std::string& instance_id, const Json& document, const Json& input) {
    ConfigSchema schema;
    try {
        schema = ConfigSchema::from_json(document);
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(instance_id + ": invalid schema document: " + e.what());
    }
    return schema.apply(input.is_null() ? Json::object() : input);
}

PluginDescriptor descriptor_from_json(const Json& data) {
    if (!data.is_object()) {
        throw ProtocolError("get_info payload is not an object");
    }

    PluginDescriptor descriptor;
    descriptor.id = codec::as_string(data.value("id", Json()), "");
    if (descriptor.id.empty()) {
        throw ProtocolError("get_info payload has no 'id'");
    }
    descriptor.name = codec::as_string(data.value("name", Json()), descriptor.id);
    descriptor.description = codec::as_string(data.value("description", Json()), "");
    descriptor.version = codec::as_string(data.value("version", Json()), "");
    descriptor.author = codec::as_string(data.value("author", Json()), "");

    if (const Json* capabilities = codec::find_key(data, "capabilities"); capabilities && capabilities->is_array()) {
        for (const auto& item : *capabilities) {
            if (auto capability = parse_capability(codec::as_string(item))) {
                descriptor.capabilities.insert(*capability);
            }
        }
    }
    if (const Json* tags = codec::find_key(data, "tags"); tags && tags->is_array()) {
        for (const auto& tag : *tags) {
            if (tag.is_string()) {
                descriptor.tags.push_back(tag.get<std::string>());
            }
        }
    }
    return descriptor;
}

PluginClient::PluginClient(std::string instance_id, ProcessOptions options, Reactor& reactor,
                           CallTimeouts timeouts)
    : instance_id_(std::move(instance_id)),
      options_(std::move(options)),
      reactor_(reactor),
      timeouts_(timeouts) {}

PluginClient::~PluginClient() {
    shutdown(std::chrono::milliseconds(500));
}

bool PendingCall::ready() const {
    return line.valid() && line.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::chrono::milliseconds PluginClient::timeout_for(const std::string& action) const {
    auto timeout = timeouts_.for_action(action);
    if (action == action_name(Action::ExecuteAction)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (advertised_execute_ && *advertised_execute_ > timeout) {
            timeout = *advertised_execute_;
        }
    }
    return timeout;
}

ResponseEnvelope PluginClient::call(const RequestEnvelope& request) {
    return call(request, timeout_for(request.action));
}

ResponseEnvelope PluginClient::call(const RequestEnvelope& request, std::chrono::milliseconds timeout) {
    PendingCall pending = begin_call(request, timeout);
    return finish_call(pending);
}

std::future<ResponseEnvelope> PluginClient::call_async(RequestEnvelope request) {
    auto pending = std::make_shared<PendingCall>(begin_call(std::move(request)));
    return std::async(std::launch::deferred, [this, pending]() { return finish_call(*pending); });
}

PendingCall PluginClient::begin_call(RequestEnvelope request) {
    auto timeout = timeout_for(request.action);
    return begin_call(std::move(request), timeout);
}

PendingCall PluginClient::begin_call(RequestEnvelope request, std::chrono::milliseconds timeout) {
    if (in_flight_.exchange(true)) {
        throw std::logic_error(instance_id_ + ": request issued while another is outstanding");
    }

    try {
        std::lock_guard<std::mutex> lock(mutex_);
        ensure_process();

        PendingCall pending;
        pending.timeout = timeout;
        pending.line = reactor_.expect_line(process_->stdout_fd(), Reactor::Clock::now() + timeout);

        LOG4CPLUS_DEBUG(host_logger(), instance_id_ << " <- " << request.action);
        if (!process_->write_all(codec::encode_request(request) + "\n")) {
            // A dead child shows up as end-of-stream in finish_call()
            LOG4CPLUS_WARN(host_logger(), instance_id_ << ": " << process_->last_error());
        }
        pending.request = std::move(request);
        return pending;
    } catch (const std::exception&) {
        in_flight_ = false;
        throw;
    }
}

ResponseEnvelope PluginClient::finish_call(PendingCall& pending) {
    InFlightGuard guard(in_flight_);
    const RequestEnvelope& request = pending.request;

    LineEvent event;
    try {
        event = pending.line.get();
    } catch (const ProtocolError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        LOG4CPLUS_ERROR(host_logger(), instance_id_ << ": " << e.what());
        discard_process();
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_) {
        throw ProcessExitedError(instance_id_ + ": plugin was shut down before answering " + request.action, -1);
    }

    if (event.outcome == LineOutcome::Timeout) {
        LOG4CPLUS_ERROR(host_logger(), instance_id_ << ": " << request.action << " timed out after "
                                                    << pending.timeout.count() << " ms, terminating plugin");
        discard_process();
        throw TimeoutError(instance_id_ + ": " + request.action + " timed out after " +
                           std::to_string(pending.timeout.count()) + " ms");
    }

    if (event.outcome == LineOutcome::Eof) {
        if (!process_->wait_for_exit(std::chrono::milliseconds(1000))) {
            process_->terminate();
        }
        int exit_code = process_->exit_code().value_or(-1);
        LOG4CPLUS_ERROR(host_logger(), instance_id_ << ": plugin exited with code " << exit_code
                                                    << " before answering " << request.action);
        discard_process();
        throw ProcessExitedError(instance_id_ + ": plugin exited with code " + std::to_string(exit_code) +
                                     " before answering " + request.action,
                                 exit_code);
    }

    ResponseEnvelope response;
    try {
        response = codec::decode_response(event.line);
    } catch (const ProtocolError& e) {
        LOG4CPLUS_ERROR(host_logger(), instance_id_ << ": malformed response to " << request.action << ": "
                                                    << e.what());
        discard_process();
        throw;
    }

    observe(request.action, response);
    return response;
}

void PluginClient::ensure_process() {
    if (process_ && process_->is_alive()) {
        return;
    }
    if (process_) {
        // Exited between calls: the plugin's state went with it
        LOG4CPLUS_WARN(host_logger(), instance_id_ << ": plugin exited with code "
                                                   << process_->exit_code().value_or(-1) << ", restarting");
        discard_process();
    }

    auto process = std::make_unique<PluginProcess>(options_);
    if (!process->spawn()) {
        known_state_ = PluginState::Failed;
        throw ProcessExitedError(instance_id_ + ": cannot start " + options_.executable + ": " +
                                     process->last_error(),
                                 127);
    }
    process_ = std::move(process);
    known_state_ = PluginState::Uninitialized;
}

void PluginClient::discard_process() {
    if (!process_) {
        return;
    }
    reactor_.release(process_->stdout_fd());
    process_->terminate();
    process_.reset();
    known_state_ = PluginState::Failed;
}

void PluginClient::observe(const std::string& action, const ResponseEnvelope& response) {
    if (response.success && response.data.is_object()) {
        if (auto state = parse_state(codec::as_string(response.data.value("state", Json()), ""))) {
            known_state_ = *state;
        }
    }
    if (response.success && action == action_name(Action::GetInfo)) {
        try {
            descriptor_ = descriptor_from_json(response.data);
        } catch (const ProtocolError& e) {
            LOG4CPLUS_WARN(host_logger(), instance_id_ << ": " << e.what());
        }
    }
    if (response.success && action == action_name(Action::GetActionConfig)) {
        const Json* timeout = codec::find_key(response.data, "timeout");
        if (timeout && timeout->is_number() && timeout->get<double>() > 0 && timeout->get<double>() <= 86400) {
            advertised_execute_ = std::chrono::milliseconds(static_cast<int64_t>(timeout->get<double>() * 1000));
        }
    }
    if (!response.success && response.error) {
        LOG4CPLUS_DEBUG(host_logger(), instance_id_ << " -> " << error_kind_name(response.error->kind) << ": "
                                                    << response.error->message);
    }
}

ResponseEnvelope PluginClient::get_info() {
    return call(make_request(Action::GetInfo));
}

ResponseEnvelope PluginClient::initialize(const Json& config) {
    RequestEnvelope request = make_request(Action::Initialize);
    request.config = config;
    return call(request);
}

ResponseEnvelope PluginClient::start() {
    return call(make_request(Action::Start));
}

ResponseEnvelope PluginClient::stop() {
    return call(make_request(Action::Stop));
}

ResponseEnvelope PluginClient::get_status() {
    return call(make_request(Action::GetStatus));
}

ResponseEnvelope PluginClient::get_health() {
    return call(make_request(Action::GetHealth));
}

ResponseEnvelope PluginClient::detect_triggers() {
    return call(make_request(Action::DetectTriggers));
}

ResponseEnvelope PluginClient::execute_action(const ActionRequest& action_request) {
    RequestEnvelope request = make_request(Action::ExecuteAction);
    request.action_request = action_request;
    return call(request);
}

ResponseEnvelope PluginClient::get_trigger_config() {
    return call(make_request(Action::GetTriggerConfig));
}

ResponseEnvelope PluginClient::get_action_config() {
    return call(make_request(Action::GetActionConfig));
}

Json PluginClient::schema_document(const ResponseEnvelope& response, const char* what, const char* key) const {
    if (!response.success) {
        const ErrorInfo& error = *response.error;
        throw HostError(error.kind, instance_id_ + ": " + what + " failed: " + error.message);
    }

    const Json* document = key ? codec::find_key(response.data, key) : &response.data;
    if (!document) {
        throw ProtocolError(instance_id_ + ": " + what + " has no '" + key + "' schema");
    }
    return *document;
}

Json PluginClient::validate_config(const Json& config) {
    if (!descriptor()) {
        auto info = get_info();
        if (!info.success) {
            throw HostError(info.error->kind, instance_id_ + ": get_info failed: " + info.error->message);
        }
    }
    auto desc = descriptor();
    if (!desc) {
        throw ProtocolError(instance_id_ + ": get_info returned no usable descriptor");
    }

    Json document;
    if (desc->has(Capability::Trigger)) {
        document = schema_document(get_trigger_config(), "get_trigger_config");
    } else if (desc->has(Capability::Action)) {
        document = schema_document(get_action_config(), "get_action_config", "config");
    } else {
        // No capability exposes a schema query
        return config.is_null() ? Json::object() : config;
    }

    return apply_schema_document(instance_id_, document, config);
}

Json PluginClient::validate_parameters(const Json& parameters) {
    Json document = schema_document(get_action_config(), "get_action_config");
    return apply_schema_document(instance_id_, document, parameters);
}

std::optional<PluginDescriptor> PluginClient::descriptor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptor_;
}

PluginState PluginClient::known_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_state_;
}

bool PluginClient::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && process_->pid() > 0 && !process_->exit_code();
}

void PluginClient::shutdown(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_) {
        return;
    }

    process_->close_stdin();
    if (!process_->wait_for_exit(grace)) {
        LOG4CPLUS_WARN(host_logger(), instance_id_ << ": plugin ignored end of input, terminating");
        process_->terminate();
    }
    LOG4CPLUS_INFO(host_logger(), instance_id_ << ": plugin exited with code " << process_->exit_code().value_or(-1));

    reactor_.release(process_->stdout_fd());
    process_.reset();
    if (known_state_ == PluginState::Running || known_state_ == PluginState::Initialized) {
        known_state_ = PluginState::Stopped;
    }
}

} // namespace stavily::host
