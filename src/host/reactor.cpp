#include "reactor.hpp"

#include "../errors.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace stavily::host {

Reactor::~Reactor() {
    stop();
}

bool Reactor::start() {
    if (running_) {
        return true;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(host_logger(), "epoll_create1: " << std::strerror(errno));
        return false;
    }

    // eventfd wakes the loop when requests arrive or deadlines change
    wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd_ < 0) {
        LOG4CPLUS_ERROR(host_logger(), "eventfd: " << std::strerror(errno));
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        LOG4CPLUS_ERROR(host_logger(), "epoll_ctl ADD wake_fd: " << std::strerror(errno));
        ::close(wake_fd_);
        wake_fd_ = -1;
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        return false;
    }

    running_ = true;
    loop_thread_ = std::thread(&Reactor::event_loop, this);
    return true;
}

void Reactor::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    wake();

    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [fd, channel] : channels_) {
            if (channel.pending) {
                channel.pending->set_exception(
                    std::make_exception_ptr(std::runtime_error("reactor stopped")));
                channel.pending.reset();
            }
        }
        channels_.clear();
        notify();
    }

    ::close(wake_fd_);
    wake_fd_ = -1;
    ::close(epoll_fd_);
    epoll_fd_ = -1;
}

std::future<LineEvent> Reactor::expect_line(int fd, Clock::time_point deadline) {
    if (!running_) {
        throw std::logic_error("reactor is not running");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    Channel& channel = channels_[fd];
    if (channel.pending) {
        throw std::logic_error("a line is already expected on fd " + std::to_string(fd));
    }

    channel.pending.emplace();
    channel.deadline = deadline;
    auto future = channel.pending->get_future();

    // Leftover bytes from the previous read may already hold the answer
    if (try_complete(fd, channel)) {
        return future;
    }

    if (!channel.registered) {
        epoll_event ev{};
        ev.events = EPOLLIN | EPOLLRDHUP;
        ev.data.fd = fd;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::string reason = std::strerror(errno);
            channel.pending.reset();
            channel.deadline.reset();
            throw std::runtime_error("epoll_ctl ADD fd " + std::to_string(fd) + ": " + reason);
        }
        channel.registered = true;
    }

    lock.unlock();
    wake();
    return future;
}

void Reactor::release(int fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(fd);
    if (it == channels_.end()) {
        return;
    }

    unregister(fd, it->second);
    bool resolved = false;
    if (it->second.pending) {
        it->second.pending->set_value(LineEvent{LineOutcome::Eof, {}});
        resolved = true;
    }
    channels_.erase(it);
    if (resolved) {
        notify();
    }
}

void Reactor::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void Reactor::notify() {
    if (listener_) {
        listener_();
    }
}

void Reactor::wake() {
    if (wake_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    ssize_t written = ::write(wake_fd_, &one, sizeof(one));
    (void)written;   // counter saturation still leaves the fd readable
}

void Reactor::unregister(int fd, Channel& channel) {
    if (channel.registered) {
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        channel.registered = false;
    }
}

void Reactor::read_available(int fd, Channel& channel) {
    char chunk[8192];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            channel.buffer.append(chunk, static_cast<size_t>(n));
            if (channel.buffer.find('\n') != std::string::npos) {
                return;
            }
            if (channel.buffer.size() > codec::kMaxLineSize) {
                return;
            }
            continue;
        }
        if (n == 0) {
            channel.eof = true;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG4CPLUS_WARN(host_logger(), "read fd " << fd << ": " << std::strerror(errno));
            channel.eof = true;
        }
        return;
    }
}

bool Reactor::try_complete(int fd, Channel& channel) {
    if (!channel.pending) {
        return false;
    }

    auto newline = channel.buffer.find('\n');
    if (newline != std::string::npos) {
        std::string line = channel.buffer.substr(0, newline);
        channel.buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        channel.pending->set_value(LineEvent{LineOutcome::Line, std::move(line)});
    } else if (channel.buffer.size() > codec::kMaxLineSize) {
        channel.buffer.clear();
        channel.pending->set_exception(std::make_exception_ptr(
            ProtocolError("response line exceeds " + std::to_string(codec::kMaxLineSize) + " bytes")));
    } else if (channel.eof) {
        // A trailing partial line is not a response
        channel.buffer.clear();
        channel.pending->set_value(LineEvent{LineOutcome::Eof, {}});
    } else {
        return false;
    }

    channel.pending.reset();
    channel.deadline.reset();
    unregister(fd, channel);
    notify();
    return true;
}

void Reactor::expire(Clock::time_point now) {
    for (auto& [fd, channel] : channels_) {
        if (channel.pending && channel.deadline && *channel.deadline <= now) {
            channel.pending->set_value(LineEvent{LineOutcome::Timeout, {}});
            channel.pending.reset();
            channel.deadline.reset();
            unregister(fd, channel);
            notify();
        }
    }
}

int Reactor::next_timeout_ms(Clock::time_point now) const {
    // Upper bound keeps the loop responsive to stop() even without a wake
    int timeout = 1000;
    for (const auto& [fd, channel] : channels_) {
        if (!channel.pending || !channel.deadline) {
            continue;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*channel.deadline - now).count();
        timeout = std::min<int>(timeout, static_cast<int>(std::max<long long>(remaining + 1, 0)));
    }
    return timeout;
}

void Reactor::event_loop() {
    const int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int timeout;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timeout = next_timeout_ms(Clock::now());
        }

        int nfds = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout);
        if (nfds < 0) {
            if (errno != EINTR && running_) {
                LOG4CPLUS_ERROR(host_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == wake_fd_) {
                uint64_t value = 0;
                while (::read(wake_fd_, &value, sizeof(value)) > 0) {
                }
                continue;
            }

            auto it = channels_.find(fd);
            if (it == channels_.end()) {
                // Released while the event was in flight
                ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                continue;
            }

            if (events[i].events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) {
                read_available(fd, it->second);
                try_complete(fd, it->second);
            }
        }

        expire(Clock::now());
    }
}

} // namespace stavily::host
