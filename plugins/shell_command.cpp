#include "shell_command.hpp"

#include "command_runner.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "system_info.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cctype>

#include <unistd.h>

namespace stavily::plugins {

namespace {

const std::vector<std::string> kDangerousPatterns = {"rm -rf", ":(){ :|:& };:", "chmod 777", "chown root"};

std::vector<std::string> string_list(const Json& value, const char* key) {
    std::vector<std::string> result;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw PluginError::validation(std::string("'") + key + "' must contain strings only");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace

std::string command_name(const std::string& command) {
    std::string word;
    char quote = 0;
    size_t i = command.find_first_not_of(" \t");
    for (; i != std::string::npos && i < command.size(); ++i) {
        char c = command[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                word += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (std::isspace(static_cast<unsigned char>(c)) || c == ';' || c == '|' || c == '&') {
            break;
        } else {
            word += c;
        }
    }

    auto slash = word.rfind('/');
    return slash == std::string::npos ? word : word.substr(slash + 1);
}

const PluginDescriptor& ShellCommand::descriptor() const {
    static const PluginDescriptor descriptor{
        "shell-command",
        "Shell Command",
        "Executes shell commands with allow/deny lists, timeouts and output limits",
        "1.0.0",
        "Stavily Team",
        {Capability::Action},
        {"automation", "shell", "command", "system"},
    };
    return descriptor;
}

ConfigSchema ShellCommand::config_schema() const {
    ConfigSchema schema("Shell command execution policy");
    schema.add("allowed_commands", ParamType::Array, "Commands allowed to run; empty allows all not blocked")
        .defaults_to(Json::array());
    schema.add("blocked_commands", ParamType::Array, "Commands that are never run")
        .defaults_to(Json{"rm", "rmdir", "dd", "mkfs", "fdisk", "format"});
    schema.add("allowed_paths", ParamType::Array, "Working directory prefixes commands may run in")
        .defaults_to(Json{"/tmp", "/var/tmp"});
    schema.add("timeout", ParamType::Integer, "Default command timeout in seconds").defaults_to(300).range(1, 3600);
    schema.add("max_output_size", ParamType::Integer, "Maximum captured bytes per output stream")
        .defaults_to(1024 * 1024)
        .range(1, 64 * 1024 * 1024);
    return schema;
}

ConfigSchema ShellCommand::parameter_schema() const {
    ConfigSchema schema("Shell command execution configuration");
    schema.add("command", ParamType::String, "Shell command to execute").required();
    schema.add("working_dir", ParamType::String, "Working directory for command execution").defaults_to("/tmp");
    schema.add("env_vars", ParamType::Object, "Environment variables to set");
    schema.add("input", ParamType::String, "Input data to pass to command via stdin");
    schema.add("timeout", ParamType::Integer, "Command timeout in seconds").range(1, 3600);
    return schema;
}

void ShellCommand::on_initialize(const Json& config, const RuntimeOptions& options) {
    allowed_commands_ = string_list(config.at("allowed_commands"), "allowed_commands");
    blocked_commands_ = string_list(config.at("blocked_commands"), "blocked_commands");
    allowed_paths_ = string_list(config.at("allowed_paths"), "allowed_paths");
    timeout_ = config.at("timeout").get<int64_t>();
    max_output_size_ = config.at("max_output_size").get<size_t>();
    demo_mode_ = options.demo_mode;

    LOG4CPLUS_INFO(plugin_logger(), "Shell Command configured (demo_mode=" << std::boolalpha << demo_mode_
                                        << ", timeout=" << timeout_ << "s)");
}

std::chrono::seconds ShellCommand::suggested_timeout() const {
    // Room for the plugin to report a command timeout itself
    return std::chrono::seconds(timeout_ + 10);
}

std::optional<std::string> ShellCommand::check_policy(const std::string& command, const std::string& working_dir) const {
    std::string name = command_name(command);
    if (name.empty()) {
        return std::string("Empty command");
    }
    if (contains(blocked_commands_, name)) {
        return "Command '" + name + "' is blocked for security";
    }
    if (!allowed_commands_.empty() && !contains(allowed_commands_, name)) {
        return "Command '" + name + "' is not in allowed list";
    }
    if (!allowed_paths_.empty()) {
        bool allowed = std::any_of(allowed_paths_.begin(), allowed_paths_.end(), [&](const std::string& path) {
            return working_dir.compare(0, path.size(), path) == 0;
        });
        if (!allowed) {
            return "Working directory '" + working_dir + "' is not allowed";
        }
    }

    std::string folded = lower(command);
    for (const auto& pattern : kDangerousPatterns) {
        if (folded.find(pattern) != std::string::npos) {
            return "Command contains dangerous pattern: " + pattern;
        }
    }
    return std::nullopt;
}

ActionResult ShellCommand::simulate(const std::string& command, const std::string& working_dir) const {
    std::string out;
    if (command.find("ls") != std::string::npos) {
        out = "file1.txt\nfile2.log\ndirectory1/\ntotal 4";
    } else if (command.find("ps") != std::string::npos) {
        out = "PID   USER     TIME  COMMAND\n1234  root     0:01  nginx\n5678  app      0:05  python app.py";
    } else if (command.find("df") != std::string::npos) {
        out = "Filesystem     1K-blocks    Used Available Use%\n/dev/sda1       10485760 5242880   5242880  50% /";
    } else {
        out = "Simulated output for command: " + command;
    }

    LOG4CPLUS_INFO(plugin_logger(), "DEMO: command '" << command << "' in " << working_dir);

    ActionResult result;
    result.status = "completed";
    result.output = Json{
        {"command", command},
        {"working_dir", working_dir},
        {"return_code", 0},
        {"stdout", out},
        {"stderr", ""},
        {"execution_time", 0.0},
        {"demo_mode", true},
    };
    return result;
}

ActionResult ShellCommand::execute_action(const ActionRequest& request) {
    const Json& parameters = request.parameters;
    std::string command = parameters.at("command").get<std::string>();
    std::string working_dir = parameters.at("working_dir").get<std::string>();
    if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw PluginError::validation("Command parameter is required");
    }

    ActionResult result;
    result.metadata = Json{{"execution_host", hostname()}};

    if (auto reason = check_policy(command, working_dir)) {
        LOG4CPLUS_WARN(plugin_logger(), "Rejected command '" << command << "': " << *reason);
        ++rejected_;
        result.status = "failed";
        result.error = *reason;
        result.output = Json{{"command", command}, {"working_dir", working_dir}};
        return result;
    }

    if (demo_mode_) {
        ActionResult simulated = simulate(command, working_dir);
        simulated.metadata = result.metadata;
        ++executed_;
        return simulated;
    }

    if (::access(working_dir.c_str(), W_OK) != 0) {
        ++rejected_;
        result.status = "failed";
        result.error = "No write access to working directory: " + working_dir;
        return result;
    }

    CommandSpec spec;
    spec.argv = {"/bin/sh", "-c", command};
    spec.workdir = working_dir;
    spec.max_output = max_output_size_;
    spec.timeout = std::chrono::seconds(parameters.contains("timeout") ? parameters.at("timeout").get<int64_t>()
                                                                       : timeout_);
    if (const auto it = parameters.find("input"); it != parameters.end() && it->is_string()) {
        spec.input = it->get<std::string>();
    }
    if (const auto it = parameters.find("env_vars"); it != parameters.end() && it->is_object()) {
        for (auto var = it->begin(); var != it->end(); ++var) {
            if (!var.value().is_string()) {
                throw PluginError::validation("env_vars." + var.key() + " must be a string");
            }
            spec.env[var.key()] = var.value().get<std::string>();
        }
    }

    CommandResult ran = run_command(spec);
    ++executed_;

    // Command output is arbitrary bytes; the response must stay valid UTF-8
    std::string stdout_text = codec::to_valid_utf8(ran.stdout_text);
    std::string stderr_text = codec::to_valid_utf8(ran.stderr_text);
    if (ran.stdout_truncated) {
        stdout_text += "\n... [output truncated]";
    }
    if (ran.stderr_truncated) {
        stderr_text += "\n... [output truncated]";
    }

    result.output = Json{
        {"command", command},
        {"working_dir", working_dir},
        {"return_code", ran.exit_code},
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"execution_time", ran.elapsed},
        {"demo_mode", false},
    };

    if (!ran.started || ran.timed_out || !ran.error.empty()) {
        LOG4CPLUS_ERROR(plugin_logger(), "Command execution failed: " << ran.error);
        result.status = "failed";
        result.error = ran.error;
    } else {
        LOG4CPLUS_INFO(plugin_logger(), "Command '" << command.substr(0, 50) << "' exited with " << ran.exit_code);
        result.status = "completed";
    }
    return result;
}

void ShellCommand::collect_health(HealthReporter& reporter) const {
    if (demo_mode_ || ::access("/bin/sh", X_OK) == 0) {
        reporter.add_check("shell", CheckResult::pass(demo_mode_ ? "demo mode, nothing is executed" : "/bin/sh available"));
    } else {
        reporter.add_check("shell", CheckResult::fail("/bin/sh is not executable"));
    }

    reporter.set_metrics(Json{
        {"allowed_commands_count", allowed_commands_.size()},
        {"blocked_commands_count", blocked_commands_.size()},
        {"executed", executed_},
        {"rejected", rejected_},
        {"timeout", timeout_},
    });
}

} // namespace stavily::plugins
