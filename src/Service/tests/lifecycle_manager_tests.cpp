#include "../LifecycleManager.h"
#include <boost/test/unit_test.hpp>
#include <echo_service/Errors.h>
#include <thread>

namespace {
auto embeddedConfig() -> ServiceConfiguration {
    return ServiceConfiguration()
            .withAddress("127.0.0.1")
            .withPort(0)
            .withMode(HostingMode::Embedded)
            .withWorkerPoolSize(2);
}

const std::vector<std::string> FULL_RELEASE_ORDER = {"listener", "routes", "business logic", "data store"};
} // namespace

BOOST_AUTO_TEST_SUITE(LifecycleManager_test_suite)
/*
 * This test suite is responsible for testing how the lifecycle manager wires, runs and tears down the service
 */

    BOOST_AUTO_TEST_CASE(test_wire_and_stop) {
        auto manager = std::make_shared<LifecycleManager>(embeddedConfig());
        BOOST_CHECK(manager->state() == LifecycleState::Uninitialized);

        manager->wire();
        BOOST_CHECK(manager->state() == LifecycleState::Serving);
        BOOST_CHECK(manager->mode() == HostingMode::Embedded);

        // Port 0 asks for an ephemeral port, the bound one is reported
        BOOST_CHECK_NE(manager->port(), 0);
        BOOST_CHECK(manager->getvReleaseLog()->empty());

        auto result = manager->stop();
        BOOST_CHECK_EQUAL(result.timedOut, false);
        BOOST_CHECK_EQUAL(result.abandonedRequests, 0);
        BOOST_CHECK(manager->state() == LifecycleState::Stopped);

        // Released in the reverse of the order they were built
        BOOST_CHECK(*manager->getvReleaseLog() == FULL_RELEASE_ORDER);

        // Wiring twice is not allowed
        BOOST_CHECK_THROW(manager->wire(), std::logic_error);
    }

    BOOST_AUTO_TEST_CASE(test_stop_is_idempotent) {
        auto manager = std::make_shared<LifecycleManager>(embeddedConfig());
        manager->wire();

        manager->stop();
        manager->stop();
        manager->stop();

        // Components are only released once
        BOOST_CHECK(*manager->getvReleaseLog() == FULL_RELEASE_ORDER);

        // run() on a stopped service returns straight away
        manager->run();
        BOOST_CHECK(manager->state() == LifecycleState::Stopped);
    }

    BOOST_AUTO_TEST_CASE(test_stop_before_wire) {
        auto manager = std::make_shared<LifecycleManager>(embeddedConfig());

        auto result = manager->stop();
        BOOST_CHECK_EQUAL(result.timedOut, false);
        BOOST_CHECK(manager->state() == LifecycleState::Uninitialized);
        BOOST_CHECK(manager->getvReleaseLog()->empty());
    }

    BOOST_AUTO_TEST_CASE(test_data_store_failure_builds_nothing) {
        auto manager = std::make_shared<LifecycleManager>(embeddedConfig().withDataStoreConfig({{"kind", "bogus"}}));

        BOOST_CHECK_THROW(manager->wire(), eConstructionError);
        BOOST_CHECK(manager->state() == LifecycleState::Stopped);
        BOOST_CHECK(manager->getvReleaseLog()->empty());
    }

    BOOST_AUTO_TEST_CASE(test_bind_failure_releases_everything) {
        auto first = std::make_shared<LifecycleManager>(embeddedConfig());
        first->wire();

        // The same port again can't be bound while the first service holds it
        auto second = std::make_shared<LifecycleManager>(embeddedConfig().withPort(first->port()));
        BOOST_CHECK_THROW(second->wire(), eConstructionError);
        BOOST_CHECK(second->state() == LifecycleState::Stopped);
        BOOST_CHECK(*second->getvReleaseLog() == FULL_RELEASE_ORDER);

        first->stop();
    }

    BOOST_AUTO_TEST_CASE(test_invalid_configuration) {
        // A caller supplied io_context makes no sense for a service that serves on run()
        auto ioContext = std::make_shared<boost::asio::io_context>();
        auto manager = std::make_shared<LifecycleManager>(
                embeddedConfig().withMode(HostingMode::Standalone).withIoContext(ioContext)
        );
        BOOST_CHECK_THROW(manager->wire(), eConstructionError);
        BOOST_CHECK(manager->state() == LifecycleState::Stopped);

        manager = std::make_shared<LifecycleManager>(embeddedConfig().withWorkerPoolSize(0));
        BOOST_CHECK_THROW(manager->wire(), eConstructionError);
        BOOST_CHECK(manager->state() == LifecycleState::Stopped);
    }

    BOOST_AUTO_TEST_CASE(test_standalone_run) {
        auto manager = std::make_shared<LifecycleManager>(embeddedConfig().withMode(HostingMode::Standalone));
        manager->wire();
        BOOST_CHECK(manager->state() == LifecycleState::Serving);

        std::thread runner([manager] {
            manager->run();
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        BOOST_CHECK(manager->state() == LifecycleState::Serving);

        manager->stop();
        runner.join();

        BOOST_CHECK(manager->state() == LifecycleState::Stopped);

        // A second run is refused
        BOOST_CHECK_THROW(manager->run(), std::logic_error);
    }

BOOST_AUTO_TEST_SUITE_END()
