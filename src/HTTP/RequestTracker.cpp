#include "RequestTracker.h"

auto RequestTracker::begin() -> bool {
    std::lock_guard<std::mutex> const lock(mTrackerMutex);

    if (bClosed) {
        return false;
    }

    inFlightCount++;
    return true;
}

void RequestTracker::finish() {
    std::lock_guard<std::mutex> const lock(mTrackerMutex);

    if (inFlightCount == 0) {
        return;
    }

    inFlightCount--;
    if (!bAbandoned) {
        completedCount++;
    }

    if (inFlightCount == 0) {
        drained.notify_all();
    }
}

void RequestTracker::close() {
    std::lock_guard<std::mutex> const lock(mTrackerMutex);

    bClosed = true;
}

auto RequestTracker::waitForDrain(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mTrackerMutex);

    return drained.wait_for(lock, timeout, [this] { return inFlightCount == 0; });
}

auto RequestTracker::abandon() -> uint64_t {
    std::lock_guard<std::mutex> const lock(mTrackerMutex);

    bAbandoned = true;
    return inFlightCount;
}

auto RequestTracker::isAbandoned() const -> bool {
    std::lock_guard<std::mutex> const lock(mTrackerMutex);

    return bAbandoned;
}

auto RequestTracker::inFlight() const -> uint64_t {
    std::lock_guard<std::mutex> const lock(mTrackerMutex);

    return inFlightCount;
}

auto RequestTracker::completed() const -> uint64_t {
    std::lock_guard<std::mutex> const lock(mTrackerMutex);

    return completedCount;
}
