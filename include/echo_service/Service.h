//
// Public entry points of the echo service
//
// This header, ServiceConfiguration.h, Errors.h and the capability interfaces are the only headers
// a caller may include. Everything under src/ is private to the echo_service library.
//

#ifndef ECHO_SERVICE_SERVICE_H
#define ECHO_SERVICE_SERVICE_H

#include <cstdint>
#include <memory>
#include <string>

#include "Errors.h"
#include "ServiceConfiguration.h"

enum class LifecycleState
{
    Uninitialized,
    Wiring,
    Serving,
    ShuttingDown,
    Stopped
};

auto lifecycleStateName(LifecycleState state) -> std::string;

struct sShutdownResult
{
    // True if the drain deadline passed with requests still in flight
    bool timedOut = false;
    uint64_t completedRequests = 0;
    // Requests that were dispatched but had not finished by the deadline. Their responses are discarded
    uint64_t abandonedRequests = 0;
};

// Handle to a running service
class IService
{
public:
    virtual ~IService() = default;

    // Prevent copying and moving
    IService(const IService&)            = delete;
    IService& operator=(const IService&) = delete;
    IService(IService&&)                 = delete;
    IService& operator=(IService&&)      = delete;

    // Standalone: serves on the calling thread and returns once the service has stopped.
    // Embedded: the service is already serving concurrently, this only waits for it to stop.
    virtual void run() = 0;

    // Stops accepting, drains in-flight requests up to the configured deadline and releases all resources.
    // Safe to call more than once, later calls return the first result.
    virtual auto stop() -> sShutdownResult = 0;

    [[nodiscard]] virtual auto state() const -> LifecycleState = 0;
    [[nodiscard]] virtual auto port() const -> uint16_t        = 0;
    [[nodiscard]] virtual auto mode() const -> HostingMode     = 0;

protected:
    IService() = default;
};

// Wires the service and binds its listener. In embedded mode the service is serving on return, and
// runs concurrently with the caller's code until stop() is called.
// Throws eConstructionError if any part of the wiring fails.
auto startService(const ServiceConfiguration& config) -> std::shared_ptr<IService>;

// Blocking entry point. Reads the configuration from the environment, serves in standalone mode
// until SIGINT or SIGTERM and returns the process exit code.
auto runService() -> int;

#endif  // ECHO_SERVICE_SERVICE_H
