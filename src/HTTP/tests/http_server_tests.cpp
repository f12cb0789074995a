#include "../HttpServer.h"
#include "../HttpUtils.h"
#include <boost/test/unit_test.hpp>
#include <client_http.hpp>
#include <future>
#include <thread>

using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

namespace {
struct HttpServerFixture {
    std::shared_ptr<RouteTable> routes = std::make_shared<RouteTable>();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::shared_ptr<HttpServer> httpServer;
    uint16_t port = 0;

    HttpServerFixture() {
        routes->add("GET", "/fast", [](const sHttpRequest & /*request*/, const RouteParams & /*params*/) {
            return jsonResponse(SimpleWeb::StatusCode::success_ok, {{"fast", true}});
        });

        auto waitFor = released;
        routes->add("GET", "/slow", [waitFor](const sHttpRequest & /*request*/, const RouteParams & /*params*/) {
            waitFor.wait();
            return jsonResponse(SimpleWeb::StatusCode::success_ok, {{"slow", true}});
        });

        sHttpServerOptions options;
        options.address = "127.0.0.1";
        options.port = 0;
        options.workerPoolSize = 2;

        httpServer = std::make_shared<HttpServer>(std::make_shared<Router>(routes), options);
        port = httpServer->bind();
        httpServer->start();
    }

    ~HttpServerFixture() {
        // Never leave a handler blocked
        try {
            release.set_value();
        } catch (std::future_error &) {
            // Already released by the test
        }

        httpServer->stop();
        httpServer->join();
    }

    HttpServerFixture(const HttpServerFixture &) = delete;
    HttpServerFixture &operator=(const HttpServerFixture &) = delete;
    HttpServerFixture(HttpServerFixture &&) = delete;
    HttpServerFixture &operator=(HttpServerFixture &&) = delete;

    [[nodiscard]] auto client() const -> TestHttpClient {
        return TestHttpClient("127.0.0.1:" + std::to_string(port));
    }
};
} // namespace

BOOST_FIXTURE_TEST_SUITE(HttpServer_test_suite, HttpServerFixture)
/*
 * This test suite is responsible for testing the HTTP transport and its request accounting
 */

    BOOST_AUTO_TEST_CASE(test_serves_requests) {
        BOOST_CHECK_NE(port, 0);
        BOOST_CHECK_EQUAL(httpServer->is_running(), true);

        auto httpClient = client();
        auto response = httpClient.request("GET", "/fast");
        BOOST_CHECK_EQUAL(response->status_code, "200 OK");
        BOOST_CHECK_EQUAL(response->content.string(), R"({"fast":true})");

        response = httpClient.request("PUT", "/fast");
        BOOST_CHECK_EQUAL(response->status_code, "404 Not Found");
        BOOST_CHECK_EQUAL(response->content.string(), R"({"error":{"kind":"not_found","message":"No route for PUT /fast"}})");

        // Both requests were tracked and finished once their responses were sent
        auto result = httpServer->drain(std::chrono::milliseconds(1000));
        BOOST_CHECK_EQUAL(result.timedOut, false);
        BOOST_CHECK_EQUAL(result.completedRequests, 2);
        BOOST_CHECK_EQUAL(httpServer->gettracker()->get()->inFlight(), 0);
    }

    BOOST_AUTO_TEST_CASE(test_drain_abandons_slow_request) {
        std::thread slowRequest([this] {
            auto httpClient = client();
            try {
                httpClient.request("GET", "/slow");
            } catch (SimpleWeb::system_error &e) {
                BOOST_TEST_MESSAGE("Slow request ended with " << e.what());
            }
        });

        while (httpServer->gettracker()->get()->inFlight() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        httpServer->stopAccepting();
        auto result = httpServer->drain(std::chrono::milliseconds(100));
        BOOST_CHECK_EQUAL(result.timedOut, true);
        BOOST_CHECK_EQUAL(result.abandonedRequests, 1);
        BOOST_CHECK_EQUAL(httpServer->gettracker()->get()->isAbandoned(), true);

        // Closing the connections lets the client go without an answer
        httpServer->stop();
        release.set_value();
        slowRequest.join();
    }

BOOST_AUTO_TEST_SUITE_END()
