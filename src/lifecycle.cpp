#include "lifecycle.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace stavily {

LifecycleStateMachine::LifecycleStateMachine(bool allow_recovery)
    : since_(std::chrono::system_clock::now()), allow_recovery_(allow_recovery) {}

PluginState LifecycleStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::chrono::system_clock::time_point LifecycleStateMachine::since() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return since_;
}

std::optional<std::string> LifecycleStateMachine::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool LifecycleStateMachine::permits(Action action) const {
    if (is_state_independent(action)) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    switch (action) {
        case Action::Initialize:
            if (state_ == PluginState::Failed) {
                return allow_recovery_;
            }
            return state_ != PluginState::Running;
        case Action::Start:
            return state_ == PluginState::Initialized || state_ == PluginState::Running;
        case Action::Stop:
            return true;
        case Action::DetectTriggers:
        case Action::ExecuteAction:
            return state_ == PluginState::Running;
        default:
            return false;
    }
}

PluginState LifecycleStateMachine::commit(Action action) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (action) {
        case Action::Initialize:
            set_state_locked(PluginState::Initialized);
            break;
        case Action::Start:
            set_state_locked(PluginState::Running);
            break;
        case Action::Stop:
            if (state_ == PluginState::Running || state_ == PluginState::Initialized) {
                set_state_locked(PluginState::Stopped);
            }
            break;
        default:
            break;
    }
    return state_;
}

void LifecycleStateMachine::fail(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = reason;
    set_state_locked(PluginState::Failed);
}

void LifecycleStateMachine::record_error(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = reason;
}

void LifecycleStateMachine::set_state_locked(PluginState next) {
    if (next == state_) {
        return;
    }
    LOG4CPLUS_DEBUG(plugin_logger(), "state " << state_name(state_) << " -> " << state_name(next));
    state_ = next;
    since_ = std::chrono::system_clock::now();
}

} // namespace stavily
