//
// Error taxonomy shared by the service and its callers
//

#ifndef ECHO_SERVICE_ERRORS_H
#define ECHO_SERVICE_ERRORS_H

#include <stdexcept>
#include <string>

// Domain error kinds. The transport maps each kind to a fixed status, see Router.cpp
enum class DomainErrorKind
{
    InvalidInput,
    NotFound,
    Unavailable
};

inline auto domainErrorKindName(DomainErrorKind kind) -> std::string
{
    switch (kind)
    {
        case DomainErrorKind::InvalidInput:
            return "invalid_input";
        case DomainErrorKind::NotFound:
            return "not_found";
        case DomainErrorKind::Unavailable:
            return "unavailable";
    }

    return "unknown";
}

// Raised while wiring the service. Nothing is left listening when this escapes startService()
class eConstructionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised by business logic. Always request scoped, never reaches the process
class eDomainError : public std::runtime_error
{
public:
    eDomainError(DomainErrorKind kind, const std::string& message) : std::runtime_error(message), errorKind(kind) {}

    [[nodiscard]] auto kind() const -> DomainErrorKind
    {
        return errorKind;
    }

private:
    DomainErrorKind errorKind;
};

// Raised by data store implementations
class eDataStoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif  // ECHO_SERVICE_ERRORS_H
