#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stavily::plugins {

struct CommandSpec {
    std::vector<std::string> argv;      // argv[0] is looked up in PATH
    std::string input;                  // written to the child's stdin
    std::optional<std::string> workdir;
    std::map<std::string, std::string> env;
    std::chrono::milliseconds timeout{300000};
    size_t max_output = 1024 * 1024;    // per stream
};

struct CommandResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;                 // exit status, or 128 + signal
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    double elapsed = 0.0;               // seconds
    std::string error;                  // why it did not start or finish
};

/**
 * Run a command to completion, capturing stdout and stderr up to max_output
 * bytes each. A capped stream ends on a UTF-8 character boundary. The child
 * runs in its own process group; on timeout the whole group is killed.
 */
CommandResult run_command(const CommandSpec& spec);

/// Keep at most cap bytes of data, never splitting a UTF-8 sequence.
size_t utf8_prefix_length(const char* data, size_t size, size_t cap);

/**
 * Kill the process group of any running command when this process receives
 * SIGTERM, SIGINT or SIGHUP, then die of the same signal.
 */
void kill_commands_on_termination();

} // namespace stavily::plugins
