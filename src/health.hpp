#pragma once

#include "protocol.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace stavily {

enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy,
};

enum class CheckOutcome {
    Pass,
    Fail,
    Inconclusive,
};

const char* health_status_name(HealthStatus status);
const char* check_outcome_name(CheckOutcome outcome);

struct CheckResult {
    CheckOutcome outcome = CheckOutcome::Inconclusive;
    std::string message;
    std::chrono::system_clock::time_point observed_at = std::chrono::system_clock::now();

    static CheckResult pass(std::string message) { return {CheckOutcome::Pass, std::move(message)}; }
    static CheckResult fail(std::string message) { return {CheckOutcome::Fail, std::move(message)}; }
    static CheckResult inconclusive(std::string message) { return {CheckOutcome::Inconclusive, std::move(message)}; }
};

struct HealthReport {
    HealthStatus status = HealthStatus::Healthy;
    PluginState state = PluginState::Uninitialized;
    std::map<std::string, CheckResult> checks;
    std::optional<std::string> last_error;
    double uptime = 0.0;                // seconds in Running, 0 otherwise
    Json metrics = Json::object();
    std::chrono::system_clock::time_point timestamp;

    Json to_json() const;
};

/**
 * Collects named sub-checks and derives the overall status: unhealthy if any
 * check failed, degraded if any is inconclusive or older than the freshness
 * threshold, healthy otherwise.
 */
class HealthReporter {
public:
    explicit HealthReporter(std::chrono::seconds freshness = std::chrono::seconds(300));

    void add_check(const std::string& name, CheckResult result);
    void set_metrics(Json metrics) { metrics_ = std::move(metrics); }

    HealthReport build(PluginState state,
                       std::optional<std::string> last_error,
                       double uptime,
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

private:
    std::chrono::seconds freshness_;
    std::map<std::string, CheckResult> checks_;
    Json metrics_ = Json::object();
};

} // namespace stavily
