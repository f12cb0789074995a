//
// HTTP transport. Owns the Simple-Web-Server listener and hands every request to the router on its own thread
//

#ifndef ECHO_SERVICE_HTTPSERVER_H
#define ECHO_SERVICE_HTTPSERVER_H

#include "../Interfaces/IServer.h"
#include "../Lib/TestingMacros.h"
#include "RequestTracker.h"
#include "Router.h"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <server_http.hpp>
#include <string>
#include <thread>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

// Gives access to the acceptor so the listening socket can be closed while connections stay open
class Listener : public HttpServerImpl {
public:
    void stopAccepting();
};

struct sHttpServerOptions {
    std::string address;
    uint16_t port = 0;
    uint32_t workerPoolSize = 1;
    // When set the caller runs this io_context and no serving thread is created
    std::shared_ptr<boost::asio::io_context> ioContext;
};

class HttpServer : public IServer, public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(std::shared_ptr<const Router> router, const sHttpServerOptions &options);
    ~HttpServer() override;

    auto bind() -> uint16_t override;
    void start() override;
    void serve() override;
    void stopAccepting() override;
    auto drain(std::chrono::milliseconds timeout) -> sShutdownResult override;
    void stop() override;
    void join() override;
    [[nodiscard]] bool is_running() const override;

private:
    void handleRequest(const std::shared_ptr<HttpServerImpl::Response> &response,
                       const std::shared_ptr<HttpServerImpl::Request> &request);

    // Runs on the request's own thread
    void process(const std::shared_ptr<HttpServerImpl::Response> &response, const sHttpRequest &request);

    // HEAD responses carry the headers of the full response without its content
    static void writeResponse(const std::shared_ptr<HttpServerImpl::Response> &response, const std::string &method,
                              const sHttpResponse &result);
    static void reportTransportError(const std::shared_ptr<HttpServerImpl::Request> &request,
                                     const SimpleWeb::error_code &errorCode);

    Listener server;
    std::thread server_thread;
    std::shared_ptr<const Router> router;
    std::shared_ptr<RequestTracker> tracker;
    bool bExternalIoContext;
    std::atomic<bool> bRunning = false;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(tracker);
};

#endif //ECHO_SERVICE_HTTPSERVER_H
