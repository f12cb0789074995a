#include "HttpServer.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include "HttpUtils.h"
#include <array>
#include <boost/asio/post.hpp>
#include <future>
#include <iostream>
#include <system_error>
#include <utility>

namespace {
// Every request method Simple-Web-Server will hand to a default resource. Unmatched paths on any of them
// must still reach the router so they get a 404
const std::array<const char *, 9> HTTP_METHODS = {
        "GET", "HEAD", "POST", "PUT", "DELETE", "PATCH", "OPTIONS", "CONNECT", "TRACE"
};
} // namespace

void Listener::stopAccepting() {
    std::lock_guard<std::mutex> const lock(start_stop_mutex);

    if (acceptor) {
        SimpleWeb::error_code errorCode;
        acceptor->close(errorCode);
    }
}

HttpServer::HttpServer(std::shared_ptr<const Router> router, const sHttpServerOptions &options)
        : router(std::move(router)), tracker(std::make_shared<RequestTracker>()),
          bExternalIoContext(options.ioContext != nullptr) {
    server.config.port = options.port;
    server.config.address = options.address;
    server.config.thread_pool_size = options.workerPoolSize;
    server.config.timeout_request = HTTP_REQUEST_TIMEOUT_SECONDS;
    server.config.timeout_content = HTTP_CONTENT_TIMEOUT_SECONDS;

    if (options.ioContext) {
        server.io_service = options.ioContext;
    }

    // Route matching is done by the router, not by Simple-Web-Server's regex table
    for (const auto *method : HTTP_METHODS) {
        server.default_resource[method] = [this](const std::shared_ptr<HttpServerImpl::Response> &response,
                                                 const std::shared_ptr<HttpServerImpl::Request> &request) {
            handleRequest(response, request);
        };
    }

    server.on_error = &HttpServer::reportTransportError;
}

HttpServer::~HttpServer() {
    server.stop();

    if (server_thread.joinable()) {
        if (server_thread.get_id() == std::this_thread::get_id()) {
            server_thread.detach();
        } else {
            server_thread.join();
        }
    }
}

auto HttpServer::bind() -> uint16_t {
    return server.bind();
}

void HttpServer::start() {
    if (bExternalIoContext) {
        // Only starts listening and queues the first accept, the caller's threads do the rest
        server.accept_and_run();
        bRunning = true;
        return;
    }

    // The posted handler only runs once the io_service is running, which is after the socket is listening
    auto listening = std::make_shared<std::promise<void>>();
    auto signalled = std::make_shared<std::atomic<bool>>(false);
    auto listeningFuture = listening->get_future();

    boost::asio::post(*server.io_service, [listening, signalled] {
        if (!signalled->exchange(true)) {
            listening->set_value();
        }
    });

    server_thread = std::thread([this, listening, signalled]() {
        try {
            serve();
        } catch (std::exception &e) {
            if (!signalled->exchange(true)) {
                listening->set_exception(std::current_exception());
            } else {
                dumpExceptions(e);
            }
        }
    });

    listeningFuture.get();
}

void HttpServer::serve() {
    bRunning = true;

    try {
        server.accept_and_run();
    } catch (std::exception &) {
        bRunning = false;
        throw;
    }

    bRunning = false;
}

void HttpServer::stopAccepting() {
    tracker->close();
    server.stopAccepting();
}

auto HttpServer::drain(std::chrono::milliseconds timeout) -> sShutdownResult {
    tracker->close();

    sShutdownResult result;
    result.timedOut = !tracker->waitForDrain(timeout);
    if (result.timedOut) {
        result.abandonedRequests = tracker->abandon();
    }
    result.completedRequests = tracker->completed();

    return result;
}

void HttpServer::stop() {
    server.stop();
}

void HttpServer::join() {
    if (server_thread.joinable()) {
        server_thread.join();
    }
}

bool HttpServer::is_running() const {
    return bRunning;
}

void HttpServer::handleRequest(const std::shared_ptr<HttpServerImpl::Response> &response,
                               const std::shared_ptr<HttpServerImpl::Request> &request) {
    if (!tracker->begin()) {
        // Shutting down. Refuse and let the client go
        response->close_connection_after_response = true;
        writeResponse(response, request->method, errorResponse(
                SimpleWeb::StatusCode::server_error_service_unavailable,
                domainErrorKindName(DomainErrorKind::Unavailable),
                "Service is shutting down"
        ));
        return;
    }

    sHttpRequest httpRequest;
    httpRequest.method = request->method;
    httpRequest.path = request->path;

    try {
        std::thread([self = shared_from_this(), response, httpRequest = std::move(httpRequest)]() mutable {
            self->process(response, httpRequest);

            // The response must go before the server, its deleter still talks to the server
            response.reset();
            self.reset();
        }).detach();
    } catch (std::system_error &e) {
        dumpExceptions(e);
        tracker->finish();

        writeResponse(response, request->method, errorResponse(
                SimpleWeb::StatusCode::server_error_service_unavailable,
                domainErrorKindName(DomainErrorKind::Unavailable),
                "Service is overloaded"
        ));
    }
}

void HttpServer::process(const std::shared_ptr<HttpServerImpl::Response> &response, const sHttpRequest &request) {
    try {
        auto result = router->dispatch(request);

        // Past the drain deadline nobody is waiting for this any more
        if (tracker->isAbandoned()) {
            tracker->finish();
            return;
        }

        writeResponse(response, request.method, result);
        response->send([tracker = this->tracker](const SimpleWeb::error_code &errorCode) {
            if (errorCode) {
                reportTransportError(nullptr, errorCode);
            }
            tracker->finish();
        });
    } catch (std::exception &e) {
        // Nothing was sent, the connection is dropped when the response goes away
        dumpExceptions(e);
        response->close_connection_after_response = true;
        tracker->finish();
    }
}

void HttpServer::writeResponse(const std::shared_ptr<HttpServerImpl::Response> &response, const std::string &method,
                               const sHttpResponse &result) {
    if (method != "HEAD") {
        response->write(result.status, result.body, result.headers);
        return;
    }

    // Same status and headers as the GET would get, but no content
    auto headers = result.headers;
    if (headers.find("Content-Length") == headers.end()) {
        headers.emplace("Content-Length", std::to_string(result.body.size()));
    }
    response->write(result.status, headers);
}

void HttpServer::reportTransportError(const std::shared_ptr<HttpServerImpl::Request> &request,
                                      const SimpleWeb::error_code &errorCode) {
    // See http://www.boost.org/doc/libs/1_55_0/doc/html/boost_asio/reference.html, Error Codes for error code meanings
    if (errorCode == boost::asio::error::operation_aborted || errorCode == boost::asio::error::eof) {
        return;
    }

    std::cerr << "API: Transport error";
    if (request) {
        std::cerr << " on " << request->method << " " << request->path;
    }
    std::cerr << ": " << errorCode.message() << std::endl;
}
