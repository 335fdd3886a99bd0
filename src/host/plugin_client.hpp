#pragma once

#include "plugin_process.hpp"
#include "reactor.hpp"

#include "../protocol.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace stavily::host {

/// Per-call deadlines, keyed by the kind of request.
struct CallTimeouts {
    std::chrono::milliseconds lifecycle{5000};     // initialize, start, stop
    std::chrono::milliseconds query{5000};         // get_* requests
    std::chrono::milliseconds detect{30000};
    std::chrono::milliseconds execute{60000};

    std::chrono::milliseconds for_action(const std::string& action) const;
};

/// A request written to the plugin whose response line is still outstanding.
struct PendingCall {
    RequestEnvelope request;
    std::chrono::milliseconds timeout{0};
    std::future<LineEvent> line;

    /// True once the reactor resolved the line (answer, timeout or end-of-stream).
    bool ready() const;
};

/**
 * Host-side handle on one plugin instance.
 *
 * The plugin process is spawned on the first call and kept for the following
 * ones. Each call writes one request line and waits for one response line.
 * A timeout, a malformed response or the process exiting first terminates
 * the process, marks the plugin Failed and throws (TimeoutError,
 * ProtocolError, ProcessExitedError). The next call starts a fresh process.
 *
 * Calls to one client are sequential: issuing a request while another is
 * outstanding throws std::logic_error. begin_call()/finish_call() split a
 * call so one thread can keep many plugins in flight on the reactor.
 *
 * A successful get_action_config that advertises a "timeout" (seconds)
 * raises the execute_action deadline to at least that value.
 */
class PluginClient {
public:
    PluginClient(std::string instance_id, ProcessOptions options, Reactor& reactor,
                 CallTimeouts timeouts = CallTimeouts());
    ~PluginClient();

    PluginClient(const PluginClient&) = delete;
    PluginClient& operator=(const PluginClient&) = delete;

    ResponseEnvelope call(const RequestEnvelope& request);
    ResponseEnvelope call(const RequestEnvelope& request, std::chrono::milliseconds timeout);

    /// Write the request now and return a deferred future that collects the
    /// response on get(). The future must be consumed before the next call.
    std::future<ResponseEnvelope> call_async(RequestEnvelope request);

    /// Write one request line. Throws std::logic_error when a call is already
    /// outstanding and ProcessExitedError when the plugin cannot be started.
    PendingCall begin_call(RequestEnvelope request);
    PendingCall begin_call(RequestEnvelope request, std::chrono::milliseconds timeout);

    /// Wait for the pending line and turn it into a response. Throws like call().
    ResponseEnvelope finish_call(PendingCall& pending);

    /// Deadline for a request, including the advertised execute_action timeout.
    std::chrono::milliseconds timeout_for(const std::string& action) const;

    ResponseEnvelope get_info();
    ResponseEnvelope initialize(const Json& config);
    ResponseEnvelope start();
    ResponseEnvelope stop();
    ResponseEnvelope get_status();
    ResponseEnvelope get_health();
    ResponseEnvelope detect_triggers();
    ResponseEnvelope execute_action(const ActionRequest& request);
    ResponseEnvelope get_trigger_config();
    ResponseEnvelope get_action_config();

    /// Validate against the plugin's declared configuration schema and return
    /// the config with defaults applied. Throws PluginError (ValidationError),
    /// or HostError when the schema cannot be fetched.
    Json validate_config(const Json& config);

    /// Same for execute_action parameters.
    Json validate_parameters(const Json& parameters);

    /// Schema document carried by a get_*_config response, or the member
    /// named key. Throws HostError for a failed response, ProtocolError when
    /// the member is missing.
    Json schema_document(const ResponseEnvelope& response, const char* what, const char* key = nullptr) const;

    /// Descriptor from the last successful get_info, if any.
    std::optional<PluginDescriptor> descriptor() const;

    /// Last state reported by the plugin, or Failed after a host-side failure.
    PluginState known_state() const;

    /// Close stdin, let the plugin exit at end of input, terminate after grace.
    void shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    bool is_running() const;
    const std::string& instance_id() const { return instance_id_; }
    const CallTimeouts& timeouts() const { return timeouts_; }

private:
    void ensure_process();
    void discard_process();
    void observe(const std::string& action, const ResponseEnvelope& response);

    std::string instance_id_;
    ProcessOptions options_;
    Reactor& reactor_;
    CallTimeouts timeouts_;

    std::atomic<bool> in_flight_{false};
    mutable std::mutex mutex_;
    std::unique_ptr<PluginProcess> process_;
    PluginState known_state_ = PluginState::Uninitialized;
    std::optional<PluginDescriptor> descriptor_;
    std::optional<std::chrono::milliseconds> advertised_execute_;
};

/// Validate input against a schema document from get_trigger_config or
/// get_action_config and return it with defaults applied. Throws PluginError
/// (ValidationError), or ProtocolError when the document is not a schema.
Json apply_schema_document(const std::string& instance_id, const Json& document, const Json& input);

/// Parse the get_info payload. Throws ProtocolError on a malformed payload.
PluginDescriptor descriptor_from_json(const Json& data);

} // namespace stavily::host
