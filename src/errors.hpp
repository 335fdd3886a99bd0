#pragma once

#include "protocol.hpp"

#include <stdexcept>
#include <string>

namespace stavily {

/// Error raised inside a plugin handler, reported as a success:false response.
class PluginError : public std::runtime_error {
public:
    PluginError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    static PluginError validation(const std::string& message) {
        return PluginError(ErrorKind::ValidationError, message);
    }
    static PluginError invalid_state(const std::string& message) {
        return PluginError(ErrorKind::InvalidState, message);
    }
    static PluginError internal(const std::string& message) {
        return PluginError(ErrorKind::InternalError, message);
    }

private:
    ErrorKind kind_;
};

/// Malformed envelope on the wire.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

/// Failures observed by the host while talking to a plugin process.
class HostError : public std::runtime_error {
public:
    HostError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TimeoutError : public HostError {
public:
    explicit TimeoutError(const std::string& message)
        : HostError(ErrorKind::TimeoutError, message) {}
};

class ProcessExitedError : public HostError {
public:
    ProcessExitedError(const std::string& message, int exit_code)
        : HostError(ErrorKind::ProcessExitedError, message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

} // namespace stavily
