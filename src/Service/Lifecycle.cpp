#include "Lifecycle.h"
#include <stdexcept>

auto lifecycleStateName(LifecycleState state) -> std::string {
    switch (state) {
        case LifecycleState::Uninitialized:
            return "Uninitialized";
        case LifecycleState::Wiring:
            return "Wiring";
        case LifecycleState::Serving:
            return "Serving";
        case LifecycleState::ShuttingDown:
            return "ShuttingDown";
        case LifecycleState::Stopped:
            return "Stopped";
    }

    return "Unknown";
}

auto Lifecycle::state() const -> LifecycleState {
    std::lock_guard<std::mutex> const lock(mStateMutex);

    return current;
}

void Lifecycle::transition(LifecycleState next) {
    std::lock_guard<std::mutex> const lock(mStateMutex);

    if (!isAllowed(current, next)) {
        throw std::logic_error(
                "Invalid lifecycle transition from " + lifecycleStateName(current) + " to " + lifecycleStateName(next)
        );
    }

    current = next;
    stateChanged.notify_all();
}

auto Lifecycle::transitionIf(LifecycleState from, LifecycleState to) -> bool {
    std::lock_guard<std::mutex> const lock(mStateMutex);

    if (current != from || !isAllowed(from, to)) {
        return false;
    }

    current = to;
    stateChanged.notify_all();
    return true;
}

void Lifecycle::waitFor(LifecycleState target) const {
    std::unique_lock<std::mutex> lock(mStateMutex);

    // States only move forward, so once past the target it will never be seen
    stateChanged.wait(lock, [this, target] {
        return static_cast<int>(current) >= static_cast<int>(target);
    });
}

auto Lifecycle::isAllowed(LifecycleState from, LifecycleState to) -> bool {
    switch (from) {
        case LifecycleState::Uninitialized:
            return to == LifecycleState::Wiring;
        case LifecycleState::Wiring:
            return to == LifecycleState::Serving || to == LifecycleState::Stopped;
        case LifecycleState::Serving:
            return to == LifecycleState::ShuttingDown;
        case LifecycleState::ShuttingDown:
            return to == LifecycleState::Stopped;
        case LifecycleState::Stopped:
            return false;
    }

    return false;
}
