#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <echo_service/Errors.h>
#include <echo_service/ServiceConfiguration.h>
#include <limits>
#include <utility>

namespace {
auto parseUnsigned(const std::string &variable, const std::string &value, uint64_t maximum) -> uint64_t {
    try {
        std::size_t consumed = 0;
        auto result = std::stoull(value, &consumed);
        if (consumed == value.size() && result <= maximum && value.find('-') == std::string::npos) {
            return result;
        }
    } catch (std::logic_error &) {
        // Reported below
    }

    throw eConstructionError(variable + " must be an integer between 0 and " + std::to_string(maximum) + ", got '" + value + "'");
}
} // namespace

auto hostingModeName(HostingMode mode) -> std::string {
    switch (mode) {
        case HostingMode::Standalone:
            return "standalone";
        case HostingMode::Embedded:
            return "embedded";
    }

    return "unknown";
}

ServiceConfiguration::ServiceConfiguration()
        : addressValue(HTTP_ADDRESS), portValue(HTTP_PORT), modeValue(HostingMode::Standalone),
          workerPoolSizeValue(HTTP_WORKER_POOL_SIZE),
          drainTimeoutValue(std::chrono::milliseconds(SHUTDOWN_DRAIN_TIMEOUT_MILLISECONDS)),
          dataStoreConfigValue(nlohmann::json::object({{"kind", "memory"}})) {}

auto ServiceConfiguration::fromEnvironment() -> ServiceConfiguration {
    ServiceConfiguration config;

    config.addressValue = GET_ENV(HTTP_ADDRESS_ENV_VARIABLE, HTTP_ADDRESS);

    config.portValue = static_cast<uint16_t>(parseUnsigned(
            HTTP_PORT_ENV_VARIABLE,
            GET_ENV(HTTP_PORT_ENV_VARIABLE, std::to_string(HTTP_PORT)),
            std::numeric_limits<uint16_t>::max()
    ));

    auto mode = GET_ENV(HOSTING_MODE_ENV_VARIABLE, hostingModeName(HostingMode::Standalone));
    if (mode == hostingModeName(HostingMode::Standalone)) {
        config.modeValue = HostingMode::Standalone;
    } else if (mode == hostingModeName(HostingMode::Embedded)) {
        config.modeValue = HostingMode::Embedded;
    } else {
        throw eConstructionError(std::string(HOSTING_MODE_ENV_VARIABLE) + " must be standalone or embedded, got '" + mode + "'");
    }

    config.workerPoolSizeValue = static_cast<uint32_t>(parseUnsigned(
            WORKER_POOL_SIZE_ENV_VARIABLE,
            GET_ENV(WORKER_POOL_SIZE_ENV_VARIABLE, std::to_string(HTTP_WORKER_POOL_SIZE)),
            std::numeric_limits<uint32_t>::max()
    ));
    if (config.workerPoolSizeValue == 0) {
        throw eConstructionError(std::string(WORKER_POOL_SIZE_ENV_VARIABLE) + " must be at least 1");
    }

    config.drainTimeoutValue = std::chrono::milliseconds(parseUnsigned(
            DRAIN_TIMEOUT_ENV_VARIABLE,
            GET_ENV(DRAIN_TIMEOUT_ENV_VARIABLE, std::to_string(SHUTDOWN_DRAIN_TIMEOUT_MILLISECONDS)),
            std::numeric_limits<uint32_t>::max()
    ));

    // Ready the data store config from the environment
    try {
        config.dataStoreConfigValue = nlohmann::json::parse(
                base64Decode(
                        GET_ENV(
                                DATA_STORE_CONFIG_ENV_VARIABLE,
                                base64Encode(R"({"kind": "memory"})")
                        )
                )
        );
    } catch (nlohmann::json::parse_error &e) {
        throw eConstructionError(std::string(DATA_STORE_CONFIG_ENV_VARIABLE) + " is not valid base64 encoded json: " + e.what());
    }

    return config;
}

auto ServiceConfiguration::withAddress(std::string value) const -> ServiceConfiguration {
    auto config = *this;
    config.addressValue = std::move(value);
    return config;
}

auto ServiceConfiguration::withPort(uint16_t value) const -> ServiceConfiguration {
    auto config = *this;
    config.portValue = value;
    return config;
}

auto ServiceConfiguration::withMode(HostingMode value) const -> ServiceConfiguration {
    auto config = *this;
    config.modeValue = value;
    return config;
}

auto ServiceConfiguration::withWorkerPoolSize(uint32_t value) const -> ServiceConfiguration {
    auto config = *this;
    config.workerPoolSizeValue = value;
    return config;
}

auto ServiceConfiguration::withDrainTimeout(std::chrono::milliseconds value) const -> ServiceConfiguration {
    auto config = *this;
    config.drainTimeoutValue = value;
    return config;
}

auto ServiceConfiguration::withDataStoreConfig(nlohmann::json value) const -> ServiceConfiguration {
    auto config = *this;
    config.dataStoreConfigValue = std::move(value);
    return config;
}

auto ServiceConfiguration::withDataStore(std::shared_ptr<IDataStore> value) const -> ServiceConfiguration {
    auto config = *this;
    config.dataStoreValue = std::move(value);
    return config;
}

auto ServiceConfiguration::withEchoService(std::shared_ptr<IEchoService> value) const -> ServiceConfiguration {
    auto config = *this;
    config.echoServiceValue = std::move(value);
    return config;
}

auto ServiceConfiguration::withIoContext(std::shared_ptr<boost::asio::io_context> value) const -> ServiceConfiguration {
    auto config = *this;
    config.ioContextValue = std::move(value);
    return config;
}
