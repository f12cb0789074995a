//
// Helpers shared by the integration tests. Only the public echo_service headers may be used here
//

#ifndef ECHO_SERVICE_TESTS_UTILS_H
#define ECHO_SERVICE_TESTS_UTILS_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>
#include <client_http.hpp>
#include <echo_service/Interfaces/IDataStore.h>

using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

// Returns true if something accepts a connection on localhost:port within about a second
auto acceptingConnections(uint16_t port) -> bool;

struct sTestResponse
{
    std::string status;
    SimpleWeb::CaseInsensitiveMultimap headers;
    std::string body;
};

// Makes one request on a fresh connection. Throws SimpleWeb::system_error if the request fails
auto makeRequest(uint16_t port, const std::string& method, const std::string& path) -> sTestResponse;

// Plain socket to the service for requests the HTTP client can't express, such as raw bytes in the
// request target, or checking exactly which bytes follow a response
class RawHttpConnection
{
public:
    explicit RawHttpConnection(uint16_t port);

    void send(const std::string& data);

    // Reads up to and including the blank line ending the next response's status line and headers
    auto readHead() -> std::string;

    // Reads exactly size bytes of content
    auto readContent(std::size_t size) -> std::string;

private:
    boost::asio::io_context ioContext;
    boost::asio::ip::tcp::socket socket;
    boost::asio::streambuf buffer;
};

// The Content-Length value of a response head, 0 if there is none
auto contentLength(const std::string& head) -> std::size_t;

// In memory counter store whose increments block until the gate is opened
class GatedDataStore : public IDataStore
{
public:
    [[nodiscard]] auto get(const std::string& key) const -> std::optional<std::string> override;
    void put(const std::string& key, const std::string& value) override;
    auto remove(const std::string& key) -> bool override;
    auto incrementCounter(const std::string& key) -> uint64_t override;

    void open();

    // Blocks until at least count increments are waiting at the gate
    void waitForWaiting(uint32_t count);

    // Increments sleep for this long before completing, regardless of the gate
    std::chrono::milliseconds delay = std::chrono::milliseconds(0);

private:
    mutable std::mutex mGateMutex;
    std::condition_variable gateChanged;
    bool bOpen = false;
    uint32_t waiting = 0;
    std::map<std::string, std::string> mData;
};

#endif  // ECHO_SERVICE_TESTS_UTILS_H
