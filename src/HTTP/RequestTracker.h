//
// Counts requests between dispatch and response so shutdown can drain them
//

#ifndef ECHO_SERVICE_REQUESTTRACKER_H
#define ECHO_SERVICE_REQUESTTRACKER_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

class RequestTracker {
public:
    // Returns false once close() has been called, the request must then be refused
    auto begin() -> bool;

    // Marks a request begun with begin() as finished
    void finish();

    // Stops new requests from beginning
    void close();

    // Returns true if everything in flight finished before the timeout
    auto waitForDrain(std::chrono::milliseconds timeout) -> bool;

    // Gives up on everything still in flight and returns how many requests that was.
    // Responses for abandoned requests must not be delivered
    auto abandon() -> uint64_t;

    [[nodiscard]] auto isAbandoned() const -> bool;
    [[nodiscard]] auto inFlight() const -> uint64_t;
    [[nodiscard]] auto completed() const -> uint64_t;

private:
    mutable std::mutex mTrackerMutex;
    std::condition_variable drained;
    bool bClosed = false;
    bool bAbandoned = false;
    uint64_t inFlightCount = 0;
    uint64_t completedCount = 0;
};

#endif //ECHO_SERVICE_REQUESTTRACKER_H
