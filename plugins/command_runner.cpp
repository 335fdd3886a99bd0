#include "command_runner.hpp"

#include "logger.hpp"

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

namespace stavily::plugins {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Process group of the command in flight, read by the signal handler
volatile sig_atomic_t active_group = 0;

extern "C" void on_termination_signal(int signo) {
    pid_t group = active_group;
    if (group > 0) {
        ::kill(-group, SIGKILL);
    }
    ::signal(signo, SIG_DFL);
    ::raise(signo);
}

// Drop a multi-byte sequence left incomplete at the end of text.
void trim_partial_utf8(std::string& text) {
    size_t back = 0;
    while (back < 4 && back < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[text.size() - 1 - back]);
        if ((c & 0xC0) != 0x80) {
            size_t needed = c >= 0xF0 ? 4 : c >= 0xE0 ? 3 : c >= 0xC0 ? 2 : 1;
            if (needed > back + 1) {
                text.resize(text.size() - 1 - back);
            }
            return;
        }
        ++back;
    }
}

void append_capped(std::string& target, const char* data, size_t size, size_t cap, bool& truncated) {
    if (truncated || size == 0) {
        return;
    }
    size_t room = cap > target.size() ? cap - target.size() : 0;
    if (size > room) {
        // Nothing after the cut is kept, so the partial character goes too
        truncated = true;
        size_t kept = utf8_prefix_length(data, size, room);
        target.append(data, kept);
        if (kept == 0) {
            // The character may have started in the previous read
            trim_partial_utf8(target);
        }
        return;
    }
    target.append(data, size);
}

} // namespace

size_t utf8_prefix_length(const char* data, size_t size, size_t cap) {
    if (size <= cap) {
        return size;
    }
    size_t length = cap;
    // data[length] is the first byte dropped: back off while it continues a sequence
    while (length > 0 && (static_cast<unsigned char>(data[length]) & 0xC0) == 0x80) {
        --length;
    }
    return length;
}

void kill_commands_on_termination() {
    struct sigaction action {};
    action.sa_handler = on_termination_signal;
    sigemptyset(&action.sa_mask);
    for (int signo : {SIGTERM, SIGINT, SIGHUP}) {
        ::sigaction(signo, &action, nullptr);
    }
}

CommandResult run_command(const CommandSpec& spec) {
    CommandResult result;
    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int in_pipe[2];
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe2: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe2: ") + std::strerror(errno);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return result;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe2: ") + std::strerror(errno);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return result;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork: ") + std::strerror(errno);
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            ::close(fd);
        }
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
#ifdef __linux__
        // SIGKILL of the plugin cannot be caught: the kernel reaps the command instead
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != parent) {
            _exit(127);
        }
#endif
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (spec.workdir && ::chdir(spec.workdir->c_str()) < 0) {
            _exit(127);
        }
        for (const auto& [key, value] : spec.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    result.started = true;
    // Both sides set the group: whichever runs first wins the race with a signal
    ::setpgid(pid, pid);
    active_group = pid;
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    int stdin_fd = in_pipe[1];
    int stdout_fd = out_pipe[0];
    int stderr_fd = err_pipe[0];
    ::fcntl(stdin_fd, F_SETFL, ::fcntl(stdin_fd, F_GETFL) | O_NONBLOCK);

    size_t input_offset = 0;
    if (spec.input.empty()) {
        close_fd(stdin_fd);
    }

    auto deadline = start + spec.timeout;
    char buffer[8192];
    while (stdout_fd >= 0 || stderr_fd >= 0) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        int wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;

        pollfd fds[3];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        int in_index = -1;
        if (stdout_fd >= 0) {
            out_index = static_cast<int>(count);
            fds[count++] = {stdout_fd, POLLIN, 0};
        }
        if (stderr_fd >= 0) {
            err_index = static_cast<int>(count);
            fds[count++] = {stderr_fd, POLLIN, 0};
        }
        if (stdin_fd >= 0) {
            in_index = static_cast<int>(count);
            fds[count++] = {stdin_fd, POLLOUT, 0};
        }

        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("poll: ") + std::strerror(errno);
            break;
        }

        auto drain = [&](int index, int& fd, std::string& target, bool& truncated) {
            if (index < 0 || !(fds[index].revents & (POLLIN | POLLHUP | POLLERR))) {
                return;
            }
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                append_capped(target, buffer, static_cast<size_t>(n), spec.max_output, truncated);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fd);
            }
        };
        drain(out_index, stdout_fd, result.stdout_text, result.stdout_truncated);
        drain(err_index, stderr_fd, result.stderr_text, result.stderr_truncated);

        if (in_index >= 0 && fds[in_index].revents) {
            if (fds[in_index].revents & (POLLERR | POLLHUP)) {
                close_fd(stdin_fd);
            } else {
                ssize_t n = ::write(stdin_fd, spec.input.data() + input_offset, spec.input.size() - input_offset);
                if (n > 0) {
                    input_offset += static_cast<size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    close_fd(stdin_fd);
                }
                if (input_offset >= spec.input.size()) {
                    close_fd(stdin_fd);
                }
            }
        }
    }

    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);

    if (result.timed_out || !result.error.empty()) {
        LOG4CPLUS_WARN(plugin_logger(), "Killing command " << spec.argv.front() << " (pid=" << pid << ")");
        ::kill(-pid, SIGKILL);
    }

    // Output closed does not mean exited: keep honouring the deadline
    int status = 0;
    pid_t waited;
    while (true) {
        waited = ::waitpid(pid, &status, WNOHANG);
        if (waited != 0 && !(waited < 0 && errno == EINTR)) {
            break;
        }
        if (waited == 0 && std::chrono::steady_clock::now() >= deadline && !result.timed_out) {
            result.timed_out = true;
            ::kill(-pid, SIGKILL);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    active_group = 0;

    if (waited == pid) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    }

    result.elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (result.timed_out) {
        result.error = "command timed out after " +
                       std::to_string(std::chrono::duration_cast<std::chrono::seconds>(spec.timeout).count()) +
                       " seconds";
    }
    return result;
}

} // namespace stavily::plugins
