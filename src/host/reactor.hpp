#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace stavily::host {

enum class LineOutcome {
    Line,
    Timeout,
    Eof,
};

struct LineEvent {
    LineOutcome outcome = LineOutcome::Eof;
    std::string line;                   // without the newline
};

/**
 * Single epoll thread that reads response lines from any number of plugin
 * stdout pipes. Callers ask for the next line on a descriptor and get a
 * future; the reactor resolves it with the line, a timeout at the deadline
 * or end-of-stream.
 *
 * Only descriptors with an outstanding request are registered with epoll.
 * Bytes read past the first newline stay buffered for the next request on
 * the same descriptor until release() is called.
 */
class Reactor {
public:
    using Clock = std::chrono::steady_clock;
    using Listener = std::function<void()>;

    Reactor() = default;
    ~Reactor();

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    /// Next line on fd (which must be non-blocking). Throws std::logic_error if
    /// the reactor is not running or a request on fd is already outstanding.
    std::future<LineEvent> expect_line(int fd, Clock::time_point deadline);

    /// Forget fd and any bytes buffered for it. An outstanding request
    /// resolves as Eof.
    void release(int fd);

    /// Called whenever an expected line resolves, with the reactor lock held.
    /// The listener must not call back into the reactor.
    void set_listener(Listener listener);

private:
    struct Channel {
        std::string buffer;
        bool eof = false;
        bool registered = false;
        std::optional<Clock::time_point> deadline;
        std::optional<std::promise<LineEvent>> pending;
    };

    void event_loop();
    void wake();
    void read_available(int fd, Channel& channel);
    bool try_complete(int fd, Channel& channel);
    void expire(Clock::time_point now);
    int next_timeout_ms(Clock::time_point now) const;
    void unregister(int fd, Channel& channel);
    void notify();

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread loop_thread_;

    mutable std::mutex mutex_;
    std::map<int, Channel> channels_;
    Listener listener_;
};

} // namespace stavily::host
