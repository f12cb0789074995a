#include "utils.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/steady_timer.hpp>
#include <thread>

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto acceptingConnections(uint16_t port) -> bool
{
    using boost::asio::io_context, boost::asio::ip::tcp;
    using ec = boost::system::error_code;

    bool result = false;

    for (auto counter = 0; counter < 10 && !result; counter++)
    {
        io_context svc;
        tcp::socket socket(svc);
        boost::asio::steady_timer tim(svc, std::chrono::milliseconds(100));

        tim.async_wait([&](ec) { socket.cancel(); });
        socket.async_connect({boost::asio::ip::make_address("127.0.0.1"), port}, [&](ec errorCode) {
            result = !errorCode;
            tim.cancel();
        });

        svc.run();

        if (!result)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    return result;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

auto makeRequest(uint16_t port, const std::string& method, const std::string& path) -> sTestResponse
{
    TestHttpClient httpClient("127.0.0.1:" + std::to_string(port));
    httpClient.config.timeout = 10;

    auto response = httpClient.request(method, path);

    sTestResponse result;
    result.status  = response->status_code;
    result.headers = response->header;
    result.body    = response->content.string();
    return result;
}

RawHttpConnection::RawHttpConnection(uint16_t port) : socket(ioContext)
{
    socket.connect({boost::asio::ip::make_address("127.0.0.1"), port});
}

void RawHttpConnection::send(const std::string& data)
{
    boost::asio::write(socket, boost::asio::buffer(data));
}

auto RawHttpConnection::readHead() -> std::string
{
    auto size = boost::asio::read_until(socket, buffer, "\r\n\r\n");

    std::string head(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_begin(buffer.data()) + size);
    buffer.consume(size);
    return head;
}

auto RawHttpConnection::readContent(std::size_t size) -> std::string
{
    if (buffer.size() < size)
    {
        boost::asio::read(socket, buffer, boost::asio::transfer_exactly(size - buffer.size()));
    }

    std::string content(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_begin(buffer.data()) + size);
    buffer.consume(size);
    return content;
}

auto contentLength(const std::string& head) -> std::size_t
{
    const std::string field = "Content-Length: ";

    auto position = head.find(field);
    if (position == std::string::npos)
    {
        return 0;
    }

    return std::stoul(head.substr(position + field.size(), head.find("\r\n", position) - position - field.size()));
}

auto GatedDataStore::get(const std::string& key) const -> std::optional<std::string>
{
    std::lock_guard<std::mutex> const lock(mGateMutex);

    auto entry = mData.find(key);
    if (entry == mData.end())
    {
        return std::nullopt;
    }

    return entry->second;
}

void GatedDataStore::put(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> const lock(mGateMutex);

    mData[key] = value;
}

auto GatedDataStore::remove(const std::string& key) -> bool
{
    std::lock_guard<std::mutex> const lock(mGateMutex);

    return mData.erase(key) != 0;
}

auto GatedDataStore::incrementCounter(const std::string& key) -> uint64_t
{
    std::this_thread::sleep_for(delay);

    std::unique_lock<std::mutex> lock(mGateMutex);

    waiting++;
    gateChanged.notify_all();
    gateChanged.wait(lock, [this] { return bOpen; });
    waiting--;

    auto value = std::to_string(std::stoull(mData.count(key) != 0 ? mData[key] : "0") + 1);
    mData[key] = value;
    return std::stoull(value);
}

void GatedDataStore::open()
{
    std::lock_guard<std::mutex> const lock(mGateMutex);

    bOpen = true;
    gateChanged.notify_all();
}

void GatedDataStore::waitForWaiting(uint32_t count)
{
    std::unique_lock<std::mutex> lock(mGateMutex);

    gateChanged.wait(lock, [this, count] { return waiting >= count; });
}
