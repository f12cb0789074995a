//
// Startup parameters for one run of the service
//

#ifndef ECHO_SERVICE_SERVICE_CONFIGURATION_H
#define ECHO_SERVICE_SERVICE_CONFIGURATION_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "Interfaces/IDataStore.h"
#include "Interfaces/IEchoService.h"

enum class HostingMode
{
    // Bind a listener and serve on the thread that calls IService::run()
    Standalone,
    // Serve on background threads (or a caller supplied io_context) and return straight away
    Embedded
};

auto hostingModeName(HostingMode mode) -> std::string;

// Immutable once built. The with*() methods return a modified copy and leave the original untouched.
class ServiceConfiguration
{
public:
    ServiceConfiguration();

    // Reads the ECHO_* environment variables. Throws eConstructionError on invalid values
    static auto fromEnvironment() -> ServiceConfiguration;

    [[nodiscard]] auto withAddress(std::string value) const -> ServiceConfiguration;
    [[nodiscard]] auto withPort(uint16_t value) const -> ServiceConfiguration;
    [[nodiscard]] auto withMode(HostingMode value) const -> ServiceConfiguration;
    [[nodiscard]] auto withWorkerPoolSize(uint32_t value) const -> ServiceConfiguration;
    [[nodiscard]] auto withDrainTimeout(std::chrono::milliseconds value) const -> ServiceConfiguration;
    [[nodiscard]] auto withDataStoreConfig(nlohmann::json value) const -> ServiceConfiguration;

    // Dependencies supplied by a test harness instead of being built from the configuration
    [[nodiscard]] auto withDataStore(std::shared_ptr<IDataStore> value) const -> ServiceConfiguration;
    [[nodiscard]] auto withEchoService(std::shared_ptr<IEchoService> value) const -> ServiceConfiguration;

    // Embedded mode only. The caller is responsible for running the io_context
    [[nodiscard]] auto withIoContext(std::shared_ptr<boost::asio::io_context> value) const -> ServiceConfiguration;

    [[nodiscard]] auto address() const -> const std::string&
    {
        return addressValue;
    }

    [[nodiscard]] auto port() const -> uint16_t
    {
        return portValue;
    }

    [[nodiscard]] auto mode() const -> HostingMode
    {
        return modeValue;
    }

    [[nodiscard]] auto workerPoolSize() const -> uint32_t
    {
        return workerPoolSizeValue;
    }

    [[nodiscard]] auto drainTimeout() const -> std::chrono::milliseconds
    {
        return drainTimeoutValue;
    }

    [[nodiscard]] auto dataStoreConfig() const -> const nlohmann::json&
    {
        return dataStoreConfigValue;
    }

    [[nodiscard]] auto dataStore() const -> const std::shared_ptr<IDataStore>&
    {
        return dataStoreValue;
    }

    [[nodiscard]] auto echoService() const -> const std::shared_ptr<IEchoService>&
    {
        return echoServiceValue;
    }

    [[nodiscard]] auto ioContext() const -> const std::shared_ptr<boost::asio::io_context>&
    {
        return ioContextValue;
    }

private:
    std::string addressValue;
    uint16_t portValue;
    HostingMode modeValue;
    uint32_t workerPoolSizeValue;
    std::chrono::milliseconds drainTimeoutValue;
    nlohmann::json dataStoreConfigValue;
    std::shared_ptr<IDataStore> dataStoreValue;
    std::shared_ptr<IEchoService> echoServiceValue;
    std::shared_ptr<boost::asio::io_context> ioContextValue;
};

#endif  // ECHO_SERVICE_SERVICE_CONFIGURATION_H
