#pragma once

#include "host_config.hpp"
#include "plugin_client.hpp"
#include "reactor.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stavily::host {

struct StepResult {
    std::string plugin;
    std::string step;                   // action name, e.g. "get_health"
    bool ok = false;
    std::string detail;                 // summary on success, error text otherwise
};

struct PluginReport {
    std::string plugin;
    std::vector<StepResult> steps;
    bool passed = false;
};

/**
 * Owns one reactor and a client per configured plugin.
 *
 * run_lifecycle_check() drives every plugin through get_info, a
 * schema-validated initialize, start, get_health, get_status, the queries of
 * its capabilities, an optional execute_action, stop and a second stop. The
 * plugins progress concurrently: the calling thread keeps one request per
 * plugin in flight on the reactor and advances a plugin whenever its line
 * resolves. A plugin's check ends at its first failing step.
 */
class PluginHost {
public:
    using StepObserver = std::function<void(const StepResult&)>;

    explicit PluginHost(HostConfig config);
    ~PluginHost();

    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;

    /// Start the reactor. False if epoll could not be set up.
    bool start();
    void shutdown();

    std::vector<PluginReport> run_lifecycle_check(const StepObserver& observer = StepObserver());

    PluginClient* client(const std::string& id);
    size_t size() const { return entries_.size(); }

private:
    void wait_for_completion(std::chrono::milliseconds limit);

    HostConfig config_;
    std::vector<PluginEntry> entries_;

    // Declared before the reactor: its listener signals these
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool woken_ = false;

    Reactor reactor_;
    std::vector<std::unique_ptr<PluginClient>> clients_;
};

} // namespace stavily::host
