#include "disk_space_monitor.hpp"

#include "errors.hpp"
#include "logger.hpp"
#include "system_info.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

#include <mntent.h>
#include <sys/statvfs.h>

namespace stavily::plugins {

namespace {

const std::vector<std::string> kDefaultPaths = {"/", "/var", "/tmp", "/home"};
const std::vector<std::string> kDefaultExcludes = {"tmpfs", "devtmpfs", "proc", "sysfs"};

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::vector<std::string> string_list(const Json& value) {
    std::vector<std::string> result;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw PluginError::validation("list entries must be strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double gib(uint64_t bytes) {
    return round2(static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
}

} // namespace

Json to_json(const FilesystemUsage& usage) {
    return Json{
        {"device", usage.device},
        {"mountpoint", usage.mountpoint},
        {"fstype", usage.fstype},
        {"total", usage.total},
        {"used", usage.used},
        {"free", usage.free},
        {"percent", round2(usage.percent)},
        {"total_gb", gib(usage.total)},
        {"used_gb", gib(usage.used)},
        {"free_gb", gib(usage.free)},
    };
}

DiskSpaceMonitor::DiskSpaceMonitor(std::string mounts_file)
    : mounts_file_(std::move(mounts_file)),
      monitored_paths_(kDefaultPaths),
      exclude_types_(kDefaultExcludes) {}

const PluginDescriptor& DiskSpaceMonitor::descriptor() const {
    static const PluginDescriptor descriptor{
        "disk-space-monitor",
        "Disk Space Monitor",
        "Monitors disk usage across filesystems with configurable thresholds",
        "1.0.0",
        "Stavily Team",
        {Capability::Trigger},
        {"system", "monitoring", "disk", "storage", "filesystem"},
    };
    return descriptor;
}

ConfigSchema DiskSpaceMonitor::config_schema() const {
    ConfigSchema schema("Disk space monitoring configuration");
    schema.add("threshold", ParamType::Number, "Disk usage threshold percentage (0-100)")
        .defaults_to(85.0)
        .range(0.0, 100.0);
    schema.add("critical_threshold", ParamType::Number, "Critical disk usage threshold percentage (0-100)")
        .defaults_to(95.0)
        .range(0.0, 100.0);
    schema.add("interval", ParamType::Integer, "Monitoring interval in seconds").defaults_to(300).range(1, 86400);
    schema.add("monitored_paths", ParamType::Array, "List of filesystem paths to monitor").defaults_to(kDefaultPaths);
    schema.add("exclude_types", ParamType::Array, "Filesystem types to exclude from monitoring")
        .defaults_to(kDefaultExcludes);
    schema.add("alert_cooldown", ParamType::Integer, "Cooldown period between alerts for same filesystem (seconds)")
        .defaults_to(600)
        .range(60, 7 * 86400);
    return schema;
}

void DiskSpaceMonitor::on_initialize(const Json& config, const RuntimeOptions& options) {
    (void)options;

    double threshold = config.at("threshold").get<double>();
    double critical = config.at("critical_threshold").get<double>();
    if (threshold >= critical) {
        throw PluginError::validation("critical_threshold must be higher than threshold");
    }

    threshold_ = threshold;
    critical_threshold_ = critical;
    interval_ = config.at("interval").get<int64_t>();
    alert_cooldown_ = std::chrono::seconds(config.at("alert_cooldown").get<int64_t>());
    monitored_paths_ = string_list(config.at("monitored_paths"));
    exclude_types_ = string_list(config.at("exclude_types"));
    last_alert_.clear();

    LOG4CPLUS_INFO(plugin_logger(), "Disk Space Monitor configured: threshold=" << threshold_ << "%, critical="
                                        << critical_threshold_ << "%, interval=" << interval_ << "s");
}

void DiskSpaceMonitor::on_start() {
    last_alert_.clear();
}

void DiskSpaceMonitor::on_stop() {
    last_alert_.clear();
}

bool DiskSpaceMonitor::is_monitored(const std::string& mountpoint, const std::string& fstype) const {
    std::string type = lower(fstype);
    for (const auto& excluded : exclude_types_) {
        if (lower(excluded) == type) {
            return false;
        }
    }
    if (monitored_paths_.empty()) {
        return true;
    }
    for (const auto& path : monitored_paths_) {
        if (mountpoint.compare(0, path.size(), path) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<FilesystemUsage> DiskSpaceMonitor::scan() const {
    FILE* mounts = ::setmntent(mounts_file_.c_str(), "r");
    if (!mounts) {
        throw PluginError::internal("cannot read " + mounts_file_);
    }

    std::vector<FilesystemUsage> result;
    mntent entry{};
    char buffer[4096];
    while (::getmntent_r(mounts, &entry, buffer, sizeof(buffer))) {
        if (!is_monitored(entry.mnt_dir, entry.mnt_type)) {
            continue;
        }

        struct statvfs stats{};
        if (::statvfs(entry.mnt_dir, &stats) != 0 || stats.f_blocks == 0) {
            LOG4CPLUS_DEBUG(plugin_logger(), "Cannot access " << entry.mnt_dir);
            continue;
        }

        FilesystemUsage usage;
        usage.device = entry.mnt_fsname;
        usage.mountpoint = entry.mnt_dir;
        usage.fstype = entry.mnt_type;
        usage.total = static_cast<uint64_t>(stats.f_blocks) * stats.f_frsize;
        usage.free = static_cast<uint64_t>(stats.f_bavail) * stats.f_frsize;
        usage.used = usage.total - static_cast<uint64_t>(stats.f_bfree) * stats.f_frsize;
        usage.percent = 100.0 * static_cast<double>(usage.used) / static_cast<double>(usage.total);
        result.push_back(std::move(usage));
    }
    ::endmntent(mounts);
    return result;
}

std::vector<TriggerEvent> DiskSpaceMonitor::evaluate(const std::vector<FilesystemUsage>& filesystems,
                                                     std::chrono::steady_clock::time_point now) {
    std::vector<TriggerEvent> events;
    for (const auto& fs : filesystems) {
        std::string level;
        double threshold;
        if (fs.percent >= critical_threshold_) {
            level = "critical";
            threshold = critical_threshold_;
        } else if (fs.percent >= threshold_) {
            level = "warning";
            threshold = threshold_;
        } else {
            continue;
        }

        std::string key = fs.mountpoint + "_" + level;
        auto last = last_alert_.find(key);
        if (last != last_alert_.end() && now - last->second < alert_cooldown_) {
            continue;
        }
        last_alert_[key] = now;

        std::string mount_key = fs.mountpoint;
        std::replace(mount_key.begin(), mount_key.end(), '/', '_');

        TriggerEvent event;
        event.id = "disk-" + level + "-" + mount_key + "-" + std::to_string(epoch_seconds());
        event.type = "disk.space." + level;
        event.severity = level == "critical" ? "critical" : "high";
        event.timestamp = now_iso();
        event.source = descriptor().id;
        event.payload = Json{
            {"alert_level", level},
            {"filesystem", to_json(fs)},
            {"threshold", threshold},
            {"usage_percent", round2(fs.percent)},
            {"free_space_gb", gib(fs.free)},
            {"system_info", system_info()},
        };
        event.tags = {"system", "disk", "storage", "filesystem", level};

        LOG4CPLUS_WARN(plugin_logger(), "Disk usage alert: " << fs.mountpoint << " at " << round2(fs.percent)
                                                              << "% (threshold: " << threshold << "%)");
        events.push_back(std::move(event));
    }
    return events;
}

std::vector<TriggerEvent> DiskSpaceMonitor::detect_triggers() {
    return evaluate(scan(), std::chrono::steady_clock::now());
}

void DiskSpaceMonitor::collect_health(HealthReporter& reporter) const {
    std::vector<FilesystemUsage> filesystems;
    try {
        filesystems = scan();
    } catch (const PluginError& e) {
        reporter.add_check("disk-accessible", CheckResult::fail(e.what()));
        return;
    }

    if (filesystems.empty()) {
        reporter.add_check("disk-accessible", CheckResult::inconclusive("no monitored filesystem is accessible"));
    } else {
        reporter.add_check("disk-accessible",
                           CheckResult::pass(std::to_string(filesystems.size()) + " filesystem(s) readable"));
    }

    double highest = 0.0;
    Json listed = Json::array();
    for (const auto& fs : filesystems) {
        highest = std::max(highest, fs.percent);
        listed.push_back(to_json(fs));
    }
    reporter.set_metrics(Json{
        {"monitored_filesystems", filesystems.size()},
        {"threshold", threshold_},
        {"critical_threshold", critical_threshold_},
        {"highest_usage", round2(highest)},
        {"filesystems", listed},
    });
}

} // namespace stavily::plugins
