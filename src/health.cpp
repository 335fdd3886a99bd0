#include "health.hpp"

namespace stavily {

const char* health_status_name(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

const char* check_outcome_name(CheckOutcome outcome) {
    switch (outcome) {
        case CheckOutcome::Pass: return "pass";
        case CheckOutcome::Fail: return "fail";
        case CheckOutcome::Inconclusive: return "inconclusive";
    }
    return "unknown";
}

Json HealthReport::to_json() const {
    Json check_map = Json::object();
    for (const auto& [name, check] : checks) {
        check_map[name] = Json{
            {"outcome", check_outcome_name(check.outcome)},
            {"message", check.message},
            {"observed_at", format_timestamp(check.observed_at)},
        };
    }

    return Json{
        {"status", health_status_name(status)},
        {"state", state_name(state)},
        {"checks", check_map},
        {"last_error", last_error ? Json(*last_error) : Json(nullptr)},
        {"uptime", uptime},
        {"metrics", metrics},
        {"timestamp", format_timestamp(timestamp)},
    };
}

HealthReporter::HealthReporter(std::chrono::seconds freshness) : freshness_(freshness) {}

void HealthReporter::add_check(const std::string& name, CheckResult result) {
    checks_[name] = std::move(result);
}

HealthReport HealthReporter::build(PluginState state,
                                   std::optional<std::string> last_error,
                                   double uptime,
                                   std::chrono::system_clock::time_point now) const {
    HealthReport report;
    report.state = state;
    report.last_error = std::move(last_error);
    report.uptime = uptime;
    report.metrics = metrics_;
    report.timestamp = now;
    report.checks = checks_;

    if (report.checks.count("lifecycle") == 0) {
        CheckResult lifecycle;
        lifecycle.observed_at = now;
        if (state == PluginState::Failed) {
            lifecycle.outcome = CheckOutcome::Fail;
            lifecycle.message = report.last_error.value_or("plugin failed");
        } else if (state == PluginState::Running) {
            lifecycle.outcome = CheckOutcome::Pass;
            lifecycle.message = "plugin is running";
        } else {
            lifecycle.outcome = CheckOutcome::Inconclusive;
            lifecycle.message = std::string("plugin is ") + state_name(state);
        }
        report.checks["lifecycle"] = std::move(lifecycle);
    }

    bool failed = false;
    bool degraded = false;
    for (const auto& [name, check] : report.checks) {
        if (check.outcome == CheckOutcome::Fail) {
            failed = true;
        } else if (check.outcome == CheckOutcome::Inconclusive || now - check.observed_at > freshness_) {
            degraded = true;
        }
    }

    if (failed) {
        report.status = HealthStatus::Unhealthy;
    } else if (degraded) {
        report.status = HealthStatus::Degraded;
    } else {
        report.status = HealthStatus::Healthy;
    }
    return report;
}

} // namespace stavily
