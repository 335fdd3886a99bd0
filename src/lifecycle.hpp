#pragma once

#include "protocol.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace stavily {

/**
 * Owner of a plugin's PluginState.
 *
 *   Uninitialized --initialize--> Initialized --start--> Running --stop--> Stopped
 *        Stopped --initialize--> Initialized
 *        any     --fault------> Failed (absorbing unless recovery is allowed)
 *
 * Callers check permits() before running a handler and call commit() only
 * after the handler succeeded.
 */
class LifecycleStateMachine {
public:
    explicit LifecycleStateMachine(bool allow_recovery = false);

    PluginState state() const;

    /// Time of the last state change.
    std::chrono::system_clock::time_point since() const;

    std::optional<std::string> last_error() const;

    bool allow_recovery() const { return allow_recovery_; }

    /// Whether the current state allows the action to run.
    bool permits(Action action) const;

    /// Apply the transition of a successfully completed action.
    PluginState commit(Action action);

    /// Enter Failed and remember why.
    void fail(const std::string& reason);

    /// Remember an error without changing state.
    void record_error(const std::string& reason);

private:
    void set_state_locked(PluginState next);

    mutable std::mutex mutex_;
    PluginState state_ = PluginState::Uninitialized;
    std::chrono::system_clock::time_point since_;
    std::optional<std::string> last_error_;
    bool allow_recovery_;
};

} // namespace stavily
