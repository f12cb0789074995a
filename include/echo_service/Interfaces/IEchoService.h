//
// Interface for the business logic capability
// No transport types may appear here
//

#ifndef ECHO_SERVICE_I_ECHO_SERVICE_H
#define ECHO_SERVICE_I_ECHO_SERVICE_H

#include <cstdint>
#include <string>

struct sEchoRequest
{
    std::string message;
};

struct sEchoResult
{
    // The message exactly as it was received
    std::string message;

    // How many times this message has been echoed, including this time
    uint64_t count = 0;
};

class IEchoService
{
public:
    virtual ~IEchoService() = default;

    // Prevent copying and moving
    IEchoService(const IEchoService&)            = delete;
    IEchoService& operator=(const IEchoService&) = delete;
    IEchoService(IEchoService&&)                 = delete;
    IEchoService& operator=(IEchoService&&)      = delete;

    // Throws eDomainError when the request can not be served
    virtual auto execute(const sEchoRequest& request) -> sEchoResult = 0;

protected:
    IEchoService() = default;
};

#endif  // ECHO_SERVICE_I_ECHO_SERVICE_H
