#pragma once

#include "plugin.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stavily::plugins {

struct FilesystemUsage {
    std::string device;
    std::string mountpoint;
    std::string fstype;
    uint64_t total = 0;
    uint64_t used = 0;
    uint64_t free = 0;
    double percent = 0.0;
};

Json to_json(const FilesystemUsage& usage);

/**
 * Trigger plugin watching filesystem usage. Emits disk.space.warning above
 * threshold and disk.space.critical above critical_threshold, once per
 * mountpoint and level per cooldown period.
 */
class DiskSpaceMonitor : public Plugin, public TriggerCapable {
public:
    /// mounts_file is read in fstab format; tests point it at a fixture.
    explicit DiskSpaceMonitor(std::string mounts_file = "/proc/mounts");

    const PluginDescriptor& descriptor() const override;
    ConfigSchema config_schema() const override;
    void on_initialize(const Json& config, const RuntimeOptions& options) override;
    void on_start() override;
    void on_stop() override;
    void collect_health(HealthReporter& reporter) const override;

    std::vector<TriggerEvent> detect_triggers() override;

    /// Usage of every monitored, non-excluded filesystem.
    std::vector<FilesystemUsage> scan() const;

    /// Events for the given usage, honouring and updating the cooldowns.
    std::vector<TriggerEvent> evaluate(const std::vector<FilesystemUsage>& filesystems,
                                       std::chrono::steady_clock::time_point now);

private:
    bool is_monitored(const std::string& mountpoint, const std::string& fstype) const;

    std::string mounts_file_;
    double threshold_ = 85.0;
    double critical_threshold_ = 95.0;
    int64_t interval_ = 300;
    std::chrono::seconds alert_cooldown_{600};
    std::vector<std::string> monitored_paths_;
    std::vector<std::string> exclude_types_;
    std::map<std::string, std::chrono::steady_clock::time_point> last_alert_;
};

} // namespace stavily::plugins
