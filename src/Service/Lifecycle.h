//
// Lifecycle state machine of one service run
//
// Uninitialized -> Wiring -> Serving -> ShuttingDown -> Stopped
//                     \-> Stopped (wiring failed)
//

#ifndef ECHO_SERVICE_LIFECYCLE_H
#define ECHO_SERVICE_LIFECYCLE_H

#include <condition_variable>
#include <echo_service/Service.h>
#include <mutex>

class Lifecycle {
public:
    [[nodiscard]] auto state() const -> LifecycleState;

    // Throws std::logic_error if the transition is not allowed
    void transition(LifecycleState next);

    // Moves from -> to only if the current state is from. Returns false otherwise
    auto transitionIf(LifecycleState from, LifecycleState to) -> bool;

    // Blocks until the given state has been reached
    void waitFor(LifecycleState target) const;

    static auto isAllowed(LifecycleState from, LifecycleState to) -> bool;

private:
    mutable std::mutex mStateMutex;
    mutable std::condition_variable stateChanged;
    LifecycleState current = LifecycleState::Uninitialized;
};

#endif //ECHO_SERVICE_LIFECYCLE_H
