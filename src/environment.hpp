#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace stavily {

constexpr const char* kDemoModeEnv = "STAVILY_DEMO_MODE";
constexpr const char* kLogConfigEnv = "STAVILY_LOG_CONFIG";
constexpr const char* kHealthFreshnessEnv = "STAVILY_HEALTH_FRESHNESS";
constexpr const char* kAllowRecoveryEnv = "STAVILY_ALLOW_RECOVERY";

/// Process-wide options a plugin reads once at startup.
struct RuntimeOptions {
    bool demo_mode = true;
    bool allow_recovery = false;
    std::chrono::seconds health_freshness{300};
    std::string log_config = "log4cplus.ini";

    static RuntimeOptions from_environment();
};

/// "true", "1", "yes", "on" / "false", "0", "no", "off", case-insensitive.
std::optional<bool> parse_bool(const std::string& text);

std::optional<std::string> get_env(const char* name);

} // namespace stavily
