#include "memory_monitor.hpp"

#include "errors.hpp"
#include "logger.hpp"
#include "system_info.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace stavily::plugins {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

Json to_json(const MemorySample& sample) {
    return Json{
        {"total_memory", sample.total},
        {"available_memory", sample.available},
        {"used_memory", sample.used},
        {"memory_percent", round2(sample.percent)},
        {"total_swap", sample.swap_total},
        {"used_swap", sample.swap_used},
        {"free_swap", sample.swap_free},
        {"swap_percent", round2(sample.swap_percent)},
        {"sampled_at", format_timestamp(sample.taken_at)},
    };
}

MemorySample parse_meminfo(std::istream& in) {
    // Values are in kB
    std::map<std::string, uint64_t> fields;
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::istringstream value(line.substr(colon + 1));
        uint64_t kb = 0;
        if (value >> kb) {
            fields[line.substr(0, colon)] = kb;
        }
    }

    auto field = [&](const char* name) -> std::optional<uint64_t> {
        auto it = fields.find(name);
        if (it == fields.end()) {
            return std::nullopt;
        }
        return it->second * 1024;
    };

    auto total = field("MemTotal");
    if (!total || *total == 0) {
        throw PluginError::internal("meminfo has no MemTotal");
    }

    MemorySample sample;
    sample.total = *total;
    if (auto available = field("MemAvailable")) {
        sample.available = *available;
    } else {
        // Kernels before 3.14 have no MemAvailable
        sample.available = field("MemFree").value_or(0) + field("Buffers").value_or(0) + field("Cached").value_or(0);
    }
    sample.available = std::min(sample.available, sample.total);
    sample.used = sample.total - sample.available;
    sample.percent = 100.0 * static_cast<double>(sample.used) / static_cast<double>(sample.total);

    sample.swap_total = field("SwapTotal").value_or(0);
    sample.swap_free = std::min(field("SwapFree").value_or(0), sample.swap_total);
    sample.swap_used = sample.swap_total - sample.swap_free;
    sample.swap_percent = sample.swap_total == 0
                              ? 0.0
                              : 100.0 * static_cast<double>(sample.swap_used) / static_cast<double>(sample.swap_total);
    sample.taken_at = std::chrono::system_clock::now();
    return sample;
}

MemoryMonitor::MemoryMonitor(std::string meminfo_file) : meminfo_file_(std::move(meminfo_file)) {}

MemoryMonitor::~MemoryMonitor() {
    stop_sampler();
}

const PluginDescriptor& MemoryMonitor::descriptor() const {
    static const PluginDescriptor descriptor{
        "memory-monitor",
        "Memory Monitor",
        "Monitors RAM and swap usage with configurable thresholds",
        "1.0.0",
        "Stavily Team",
        {Capability::Trigger},
        {"system", "monitoring", "memory", "ram", "swap"},
    };
    return descriptor;
}

ConfigSchema MemoryMonitor::config_schema() const {
    ConfigSchema schema("Memory monitoring configuration");
    schema.add("threshold", ParamType::Number, "Memory usage threshold percentage (0-100)")
        .defaults_to(85.0)
        .range(0.0, 100.0);
    schema.add("critical_threshold", ParamType::Number, "Memory usage reported as critical (0-100)")
        .defaults_to(95.0)
        .range(0.0, 100.0);
    schema.add("swap_threshold", ParamType::Number, "Swap usage threshold percentage (0-100)")
        .defaults_to(90.0)
        .range(0.0, 100.0);
    schema.add("interval", ParamType::Integer, "Sampling interval in seconds").defaults_to(60).range(1, 86400);
    schema.add("alert_cooldown", ParamType::Integer, "Cooldown period between alerts of the same type (seconds)")
        .defaults_to(300)
        .range(0, 7 * 86400);
    return schema;
}

void MemoryMonitor::on_initialize(const Json& config, const RuntimeOptions& options) {
    (void)options;

    double threshold = config.at("threshold").get<double>();
    double critical = config.at("critical_threshold").get<double>();
    if (threshold >= critical) {
        throw PluginError::validation("critical_threshold must be higher than threshold");
    }

    threshold_ = threshold;
    critical_threshold_ = critical;
    swap_threshold_ = config.at("swap_threshold").get<double>();
    interval_ = std::chrono::seconds(config.at("interval").get<int64_t>());
    alert_cooldown_ = std::chrono::seconds(config.at("alert_cooldown").get<int64_t>());
    last_alert_.clear();

    LOG4CPLUS_INFO(plugin_logger(), "Memory Monitor configured: memory=" << threshold_ << "%, swap=" << swap_threshold_
                                        << "%, interval=" << interval_.count() << "s");
}

MemorySample MemoryMonitor::read_sample() const {
    std::ifstream in(meminfo_file_);
    if (!in) {
        throw PluginError::internal("cannot read " + meminfo_file_);
    }
    return parse_meminfo(in);
}

void MemoryMonitor::on_start() {
    stop_sampler();

    // First sample up front so detect_triggers has data right away
    MemorySample first = read_sample();
    {
        std::lock_guard<std::mutex> lock(sample_mutex_);
        latest_ = first;
        sampler_error_.reset();
        stop_requested_ = false;
    }
    last_alert_.clear();
    sampler_ = std::thread(&MemoryMonitor::sampler_loop, this);
}

void MemoryMonitor::on_stop() {
    stop_sampler();
}

void MemoryMonitor::stop_sampler() {
    {
        std::lock_guard<std::mutex> lock(sample_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (sampler_.joinable()) {
        sampler_.join();
        LOG4CPLUS_DEBUG(plugin_logger(), "Memory sampler stopped");
    }
}

void MemoryMonitor::sampler_loop() {
    std::unique_lock<std::mutex> lock(sample_mutex_);
    while (!wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
        lock.unlock();
        std::optional<MemorySample> sample;
        std::optional<std::string> error;
        try {
            sample = read_sample();
        } catch (const PluginError& e) {
            error = e.what();
            LOG4CPLUS_WARN(plugin_logger(), "Memory sample failed: " << e.what());
        }
        lock.lock();

        if (sample) {
            latest_ = sample;
        }
        sampler_error_ = error;
    }
}

std::optional<MemorySample> MemoryMonitor::latest_sample() const {
    std::lock_guard<std::mutex> lock(sample_mutex_);
    return latest_;
}

std::vector<TriggerEvent> MemoryMonitor::evaluate(const MemorySample& sample,
                                                  std::chrono::steady_clock::time_point now) {
    std::vector<TriggerEvent> events;

    auto should_alert = [&](const std::string& key) {
        auto last = last_alert_.find(key);
        if (last != last_alert_.end() && now - last->second < alert_cooldown_) {
            return false;
        }
        last_alert_[key] = now;
        return true;
    };

    auto make_event = [&](const std::string& kind, double usage, double threshold, std::string severity) {
        TriggerEvent event;
        event.id = "memory-" + kind + "-" + std::to_string(epoch_seconds());
        event.type = kind == "memory" ? "memory.high" : "swap.high";
        event.severity = std::move(severity);
        event.timestamp = now_iso();
        event.source = descriptor().id;
        event.payload = Json{
            {"alert_type", kind},
            {"usage_percent", round2(usage)},
            {"threshold", threshold},
            {"memory_info", to_json(sample)},
            {"system_info", system_info()},
        };
        event.tags = {"system", "memory", kind, event.severity};

        LOG4CPLUS_WARN(plugin_logger(), "High " << kind << " usage: " << round2(usage) << "% (threshold: "
                                                 << threshold << "%)");
        return event;
    };

    if (sample.percent > threshold_ && should_alert("memory")) {
        std::string severity = sample.percent >= critical_threshold_ ? "critical"
                               : sample.percent > 90.0              ? "high"
                                                                    : "medium";
        events.push_back(make_event("memory", sample.percent, threshold_, severity));
    }

    if (sample.swap_total > 0 && sample.swap_percent > swap_threshold_ && should_alert("swap")) {
        events.push_back(make_event("swap", sample.swap_percent, swap_threshold_,
                                    sample.swap_percent > 95.0 ? "critical" : "high"));
    }

    return events;
}

std::vector<TriggerEvent> MemoryMonitor::detect_triggers() {
    auto sample = latest_sample();
    if (!sample) {
        return {};
    }
    return evaluate(*sample, std::chrono::steady_clock::now());
}

void MemoryMonitor::collect_health(HealthReporter& reporter) const {
    try {
        MemorySample current = read_sample();
        reporter.add_check("meminfo-readable", CheckResult::pass(meminfo_file_ + " readable"));
        reporter.set_metrics(Json{
            {"current_memory_percent", round2(current.percent)},
            {"current_swap_percent", round2(current.swap_percent)},
            {"memory_threshold", threshold_},
            {"swap_threshold", swap_threshold_},
        });
    } catch (const PluginError& e) {
        reporter.add_check("meminfo-readable", CheckResult::fail(e.what()));
    }

    std::lock_guard<std::mutex> lock(sample_mutex_);
    if (!sampler_.joinable() || !latest_) {
        reporter.add_check("sampler-fresh", CheckResult::inconclusive("sampler is not running"));
        return;
    }

    // A sampler that misses two intervals is stuck
    auto age = std::chrono::system_clock::now() - latest_->taken_at;
    CheckResult result = age > 2 * interval_ + std::chrono::seconds(1)
                             ? CheckResult::fail("no sample for " +
                                                 std::to_string(std::chrono::duration_cast<std::chrono::seconds>(age).count()) + "s")
                             : CheckResult::pass("last sample " + format_timestamp(latest_->taken_at));
    if (sampler_error_) {
        result = CheckResult::inconclusive("last sample failed: " + *sampler_error_);
    }
    result.observed_at = latest_->taken_at;
    reporter.add_check("sampler-fresh", result);
}

} // namespace stavily::plugins
