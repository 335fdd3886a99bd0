#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace stavily::host {

struct ProcessOptions {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // added to the inherited environment
    std::optional<std::string> workdir;
    bool die_with_host = true;                // SIGTERM the child when the host exits
};

/**
 * A child process with piped stdin/stdout. stderr is inherited so plugin
 * diagnostics reach the host's log. The stdout pipe is non-blocking.
 */
class PluginProcess {
public:
    explicit PluginProcess(ProcessOptions options);
    ~PluginProcess();

    PluginProcess(const PluginProcess&) = delete;
    PluginProcess& operator=(const PluginProcess&) = delete;

    /// Fork and exec. Returns false and sets last_error() on failure.
    /// A failing exec shows up as exit code 127.
    bool spawn();

    bool is_alive();

    /// Write all bytes to the child's stdin. False on error (e.g. child gone).
    bool write_all(const std::string& data);

    /// Signal end of input to the child.
    void close_stdin();

    /// Close stdin, SIGTERM, wait up to grace, then SIGKILL. Always reaps.
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    /// Wait up to timeout for the child to exit on its own.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    /// Exit status, or 128 + signal number; empty while running.
    std::optional<int> exit_code() const { return exit_code_; }

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    const ProcessOptions& options() const { return options_; }
    const std::string& last_error() const { return error_; }

private:
    bool reap(bool block);
    void close_fds();

    ProcessOptions options_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::optional<int> exit_code_;
    std::string error_;
};

} // namespace stavily::host
