#pragma once

#include "plugin.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace stavily::plugins {

struct MemorySample {
    uint64_t total = 0;                 // bytes
    uint64_t available = 0;
    uint64_t used = 0;
    double percent = 0.0;
    uint64_t swap_total = 0;
    uint64_t swap_free = 0;
    uint64_t swap_used = 0;
    double swap_percent = 0.0;
    std::chrono::system_clock::time_point taken_at;
};

Json to_json(const MemorySample& sample);

/// Parse /proc/meminfo content. Throws PluginError (InternalError) when
/// MemTotal is missing.
MemorySample parse_meminfo(std::istream& in);

/**
 * Trigger plugin watching RAM and swap usage. A background thread samples
 * the meminfo file every interval while the plugin runs; detect_triggers
 * evaluates the latest sample.
 */
class MemoryMonitor : public Plugin, public TriggerCapable {
public:
    explicit MemoryMonitor(std::string meminfo_file = "/proc/meminfo");
    ~MemoryMonitor() override;

    const PluginDescriptor& descriptor() const override;
    ConfigSchema config_schema() const override;
    void on_initialize(const Json& config, const RuntimeOptions& options) override;
    void on_start() override;
    void on_stop() override;
    void collect_health(HealthReporter& reporter) const override;

    std::vector<TriggerEvent> detect_triggers() override;

    MemorySample read_sample() const;
    std::optional<MemorySample> latest_sample() const;
    bool sampler_running() const { return sampler_.joinable(); }

    /// Events for a sample, honouring and updating the cooldowns.
    std::vector<TriggerEvent> evaluate(const MemorySample& sample, std::chrono::steady_clock::time_point now);

private:
    void sampler_loop();
    void stop_sampler();

    std::string meminfo_file_;
    double threshold_ = 85.0;
    double critical_threshold_ = 95.0;
    double swap_threshold_ = 90.0;
    std::chrono::seconds interval_{60};
    std::chrono::seconds alert_cooldown_{300};
    std::map<std::string, std::chrono::steady_clock::time_point> last_alert_;

    std::thread sampler_;
    bool stop_requested_ = false;
    std::condition_variable wake_;
    mutable std::mutex sample_mutex_;
    std::optional<MemorySample> latest_;
    std::optional<std::string> sampler_error_;
};

} // namespace stavily::plugins
