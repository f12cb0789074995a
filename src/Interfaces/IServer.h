//
// Common server interface
// Defines the lifecycle methods the service lifecycle manager drives a listener through
//

#ifndef ECHO_SERVICE_I_SERVER_H
#define ECHO_SERVICE_I_SERVER_H

#include <chrono>
#include <cstdint>
#include <echo_service/Service.h>

class IServer
{
protected:
    IServer() = default;

public:
    virtual ~IServer() = default;

    // Prevent copying and moving
    IServer(const IServer&)            = delete;
    IServer& operator=(const IServer&) = delete;
    IServer(IServer&&)                 = delete;
    IServer& operator=(IServer&&)      = delete;

    // Binds the listening socket and returns the bound port. Throws on failure
    virtual auto bind() -> uint16_t = 0;

    // Starts accepting without blocking the caller
    virtual void start() = 0;

    // Accepts and serves on the calling thread until stop() is called
    virtual void serve() = 0;

    // Closes the listening socket, connections already open keep being served
    virtual void stopAccepting() = 0;

    // Waits for in-flight requests up to timeout, abandoning whatever is left
    virtual auto drain(std::chrono::milliseconds timeout) -> sShutdownResult = 0;

    // Closes every connection and stops serving
    virtual void stop() = 0;
    virtual void join() = 0;
    [[nodiscard]] virtual bool is_running() const = 0;
};

#endif  // ECHO_SERVICE_I_SERVER_H
