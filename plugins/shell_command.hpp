#pragma once

#include "plugin.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stavily::plugins {

/// Basename of the first word of a shell command line, quotes removed.
std::string command_name(const std::string& command);

/**
 * Action plugin running shell commands under an allow/deny policy. Demo mode
 * returns canned output without executing anything.
 */
class ShellCommand : public Plugin, public ActionCapable {
public:
    const PluginDescriptor& descriptor() const override;
    ConfigSchema config_schema() const override;
    void on_initialize(const Json& config, const RuntimeOptions& options) override;
    void collect_health(HealthReporter& reporter) const override;

    ConfigSchema parameter_schema() const override;
    ActionResult execute_action(const ActionRequest& request) override;
    std::chrono::seconds suggested_timeout() const override;

    /// Reason the command may not run, if any.
    std::optional<std::string> check_policy(const std::string& command, const std::string& working_dir) const;

private:
    ActionResult simulate(const std::string& command, const std::string& working_dir) const;

    bool demo_mode_ = true;
    std::vector<std::string> allowed_commands_;
    std::vector<std::string> blocked_commands_{"rm", "rmdir", "dd", "mkfs", "fdisk", "format"};
    std::vector<std::string> allowed_paths_{"/tmp", "/var/tmp"};
    int64_t timeout_ = 300;
    size_t max_output_size_ = 1024 * 1024;
    uint64_t executed_ = 0;
    uint64_t rejected_ = 0;
};

} // namespace stavily::plugins
