#include "environment.hpp"

#include <cctype>
#include <cstdlib>

namespace stavily {

std::optional<bool> parse_bool(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

RuntimeOptions RuntimeOptions::from_environment() {
    RuntimeOptions options;

    if (auto demo = get_env(kDemoModeEnv)) {
        options.demo_mode = parse_bool(*demo).value_or(options.demo_mode);
    }
    if (auto recovery = get_env(kAllowRecoveryEnv)) {
        options.allow_recovery = parse_bool(*recovery).value_or(false);
    }
    if (auto freshness = get_env(kHealthFreshnessEnv)) {
        char* end = nullptr;
        long seconds = std::strtol(freshness->c_str(), &end, 10);
        if (end != freshness->c_str() && *end == '\0' && seconds > 0) {
            options.health_freshness = std::chrono::seconds(seconds);
        }
    }
    if (auto log_config = get_env(kLogConfigEnv)) {
        options.log_config = *log_config;
    }
    return options;
}

} // namespace stavily
