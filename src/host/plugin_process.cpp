#include "plugin_process.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif
#include <unistd.h>

extern char** environ;

namespace stavily::host {

PluginProcess::PluginProcess(ProcessOptions options) : options_(std::move(options)) {}

PluginProcess::~PluginProcess() {
    if (pid_ > 0 && !exit_code_) {
        terminate();
    }
    close_fds();
}

bool PluginProcess::spawn() {
    if (pid_ > 0 && !exit_code_) {
        error_ = "process already running";
        return false;
    }

    // Everything the child needs is built before fork
    std::vector<std::string> argv_strings;
    argv_strings.push_back(options_.executable);
    argv_strings.insert(argv_strings.end(), options_.args.begin(), options_.args.end());

    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq != std::string::npos) {
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options_.env) {
        merged[key] = value;
    }
    std::vector<std::string> env_strings;
    env_strings.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (auto& arg : argv_strings) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& kv : env_strings) {
        envp.push_back(kv.data());
    }
    envp.push_back(nullptr);

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (::pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = std::string("pipe2: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = std::string("pipe2: ") + std::strerror(errno);
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        return false;
    }

    pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) {
        error_ = std::string("fork: ") + std::strerror(errno);
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        return false;
    }

    if (pid == 0) {
#ifdef __linux__
        if (options_.die_with_host) {
            ::prctl(PR_SET_PDEATHSIG, SIGTERM);
            // The host may have died before the request took effect
            if (::getppid() != parent) {
                _exit(127);
            }
        }
#endif
        // dup2 clears FD_CLOEXEC on the duplicated descriptors
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        if (options_.workdir && ::chdir(options_.workdir->c_str()) < 0) {
            _exit(127);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    close_fds();
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    ::fcntl(stdin_fd_, F_SETFL, ::fcntl(stdin_fd_, F_GETFL) | O_NONBLOCK);
    ::fcntl(stdout_fd_, F_SETFL, ::fcntl(stdout_fd_, F_GETFL) | O_NONBLOCK);

    pid_ = pid;
    exit_code_.reset();
    error_.clear();

    LOG4CPLUS_INFO(host_logger(), "Spawned " << options_.executable << " (pid=" << pid_ << ")");
    return true;
}

bool PluginProcess::is_alive() {
    if (pid_ <= 0 || exit_code_) {
        return false;
    }
    return !reap(false);
}

bool PluginProcess::write_all(const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        if (stdin_fd_ < 0) {
            error_ = "stdin closed";
            return false;
        }

        ssize_t written = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (written > 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Pipe full: give the child a moment to drain it
            pollfd pfd{stdin_fd_, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, 1000);
            if (ready <= 0 || (pfd.revents & (POLLERR | POLLHUP))) {
                error_ = "plugin is not reading its input";
                return false;
            }
            continue;
        }

        error_ = std::string("write: ") + std::strerror(errno);
        return false;
    }
    return true;
}

void PluginProcess::close_stdin() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void PluginProcess::terminate(std::chrono::milliseconds grace) {
    close_stdin();
    if (pid_ <= 0 || exit_code_ || reap(false)) {
        return;
    }

    LOG4CPLUS_INFO(host_logger(), "Terminating " << options_.executable << " (pid=" << pid_ << ")");
    if (::kill(pid_, SIGTERM) == 0 && wait_for_exit(grace)) {
        return;
    }

    LOG4CPLUS_WARN(host_logger(), "Killing " << options_.executable << " (pid=" << pid_ << ")");
    ::kill(pid_, SIGKILL);
    reap(true);
}

bool PluginProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (pid_ <= 0 || exit_code_ || reap(false)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool PluginProcess::reap(bool block) {
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            return false;
        }
        LOG4CPLUS_DEBUG(host_logger(), options_.executable << " exited with " << *exit_code_);
        return true;
    }
    if (result < 0) {
        // ECHILD: reaped elsewhere, nothing left to wait for
        exit_code_ = -1;
        return true;
    }
    return false;
}

void PluginProcess::close_fds() {
    close_stdin();
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

} // namespace stavily::host
