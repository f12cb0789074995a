//
// Compiled defaults and environment lookup
//

#ifndef ECHO_SERVICE_SETTINGS_H
#define ECHO_SERVICE_SETTINGS_H

#include <cstdint>
#include <cstdlib>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

constexpr const char* HTTP_ADDRESS_ENV_VARIABLE = "ECHO_HTTP_ADDRESS";
constexpr const char* HTTP_PORT_ENV_VARIABLE = "ECHO_HTTP_PORT";
constexpr const char* HOSTING_MODE_ENV_VARIABLE = "ECHO_HOSTING_MODE";
constexpr const char* WORKER_POOL_SIZE_ENV_VARIABLE = "ECHO_WORKER_POOL_SIZE";
constexpr const char* DRAIN_TIMEOUT_ENV_VARIABLE = "ECHO_DRAIN_TIMEOUT_MS";
constexpr const char* DATA_STORE_CONFIG_ENV_VARIABLE = "ECHO_DATA_STORE_CONFIG";

constexpr const char* HTTP_ADDRESS = "0.0.0.0";
const uint16_t HTTP_PORT = 8000;
const uint32_t HTTP_WORKER_POOL_SIZE = 32;
const uint32_t HTTP_REQUEST_TIMEOUT_SECONDS = 5;
const uint32_t HTTP_CONTENT_TIMEOUT_SECONDS = 300;

#ifndef BUILD_TESTS
const uint32_t SHUTDOWN_DRAIN_TIMEOUT_MILLISECONDS = 5000;
#else
const uint32_t SHUTDOWN_DRAIN_TIMEOUT_MILLISECONDS = 500;
#endif

// Longest message the echo route accepts, in bytes after percent decoding
const std::size_t ECHO_MAX_MESSAGE_LENGTH = 1024;

// Route prefix of the echo endpoint
constexpr const char* ECHO_ROUTE_PATH = "/echo/";

#endif //ECHO_SERVICE_SETTINGS_H
