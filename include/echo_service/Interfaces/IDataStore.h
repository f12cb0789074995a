//
// Interface for the data access capability
// Implementations must be safe to call from many request threads at once
//

#ifndef ECHO_SERVICE_I_DATA_STORE_H
#define ECHO_SERVICE_I_DATA_STORE_H

#include <cstdint>
#include <optional>
#include <string>

class IDataStore
{
public:
    virtual ~IDataStore() = default;

    // Prevent copying and moving
    IDataStore(const IDataStore&)            = delete;
    IDataStore& operator=(const IDataStore&) = delete;
    IDataStore(IDataStore&&)                 = delete;
    IDataStore& operator=(IDataStore&&)      = delete;

    // All operations throw eDataStoreError on failure
    [[nodiscard]] virtual auto get(const std::string& key) const -> std::optional<std::string> = 0;
    virtual void put(const std::string& key, const std::string& value)                       = 0;
    virtual auto remove(const std::string& key) -> bool                                       = 0;

    // Atomically adds one to the counter stored under key and returns the new value
    virtual auto incrementCounter(const std::string& key) -> uint64_t = 0;

protected:
    IDataStore() = default;
};

#endif  // ECHO_SERVICE_I_DATA_STORE_H
