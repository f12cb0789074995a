#include "LifecycleManager.h"
#include "../DB/DataStoreFactory.h"
#include "../Echo/EchoService.h"
#include "../HTTP/EchoApi.h"
#include "../HTTP/HttpServer.h"
#include "../HTTP/RouteTable.h"
#include "../HTTP/Router.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <iostream>
#include <stdexcept>
#include <utility>

LifecycleManager::LifecycleManager(ServiceConfiguration config) : config(std::move(config)) {}

LifecycleManager::~LifecycleManager() {
    if (lifecycle.state() != LifecycleState::Serving) {
        return;
    }

    try {
        stop();
    } catch (std::exception &e) {
        dumpExceptions(e);
    }
}

void LifecycleManager::wire() {
    lifecycle.transition(LifecycleState::Wiring);

    try {
        construct();
    } catch (eConstructionError &e) {
        std::cerr << "Service: Wiring failed - " << e.what() << std::endl;
        releaseResources();
        lifecycle.transition(LifecycleState::Stopped);
        throw;
    } catch (std::exception &e) {
        dumpExceptions(e);
        releaseResources();
        lifecycle.transition(LifecycleState::Stopped);
        throw eConstructionError(std::string("Service wiring failed: ") + e.what());
    }

    lifecycle.transition(LifecycleState::Serving);

    std::cout << "Service: Serving in " << hostingModeName(config.mode()) << " mode on port " << boundPort
              << std::endl;
}

void LifecycleManager::construct() {
    if (config.ioContext() && config.mode() != HostingMode::Embedded) {
        throw eConstructionError("A caller supplied io_context can only be used in embedded mode");
    }

    if (config.workerPoolSize() == 0) {
        throw eConstructionError("The worker pool needs at least one thread");
    }

    std::lock_guard<std::mutex> const lock(mComponentMutex);

    // Data access first
    dataStore = config.dataStore() ? config.dataStore() : createDataStore(config.dataStoreConfig());

    // Then the business logic, which only ever sees the data store interface
    echoService = config.echoService() ? config.echoService() : std::make_shared<EchoService>(dataStore);

    // Then the routes, which only ever see the business logic interface
    routeTable = std::make_shared<RouteTable>();
    EchoApi(ECHO_ROUTE_PATH, *routeTable, echoService);
    router = std::make_shared<Router>(routeTable);

    // Finally the listener
    sHttpServerOptions options;
    options.address = config.address();
    options.port = config.port();
    options.workerPoolSize = config.workerPoolSize();
    options.ioContext = config.ioContext();

    auto concreteHttpServer = std::make_shared<HttpServer>(router, options);
    listener = concreteHttpServer;
    boundPort = listener->bind();

    // Embedded mode serves from here on, standalone waits for run()
    if (config.mode() == HostingMode::Embedded) {
        listener->start();
    }
}

void LifecycleManager::run() {
    if (config.mode() == HostingMode::Standalone) {
        {
            std::lock_guard<std::mutex> const lock(mRunMutex);
            if (bRunCalled) {
                throw std::logic_error("run() may only be called once per service");
            }
            bRunCalled = true;
        }

        std::shared_ptr<IServer> server;
        {
            std::lock_guard<std::mutex> const lock(mComponentMutex);
            server = listener;
        }

        if (server && lifecycle.state() == LifecycleState::Serving) {
            std::cout << "API: Server listening on port " << boundPort << std::endl << std::endl;

            try {
                server->serve();
            } catch (std::exception &e) {
                // A stop() racing the start of serve() closes the acceptor underneath it
                if (lifecycle.state() == LifecycleState::Serving) {
                    dumpExceptions(e);
                    stop();
                }
            }
        }
    }

    lifecycle.waitFor(LifecycleState::Stopped);
}

auto LifecycleManager::stop() -> sShutdownResult {
    std::lock_guard<std::mutex> const lock(mStopMutex);

    if (shutdownResult) {
        return *shutdownResult;
    }

    if (!lifecycle.transitionIf(LifecycleState::Serving, LifecycleState::ShuttingDown)) {
        // Never got as far as serving, nothing to drain
        return {};
    }

    std::shared_ptr<IServer> server;
    {
        std::lock_guard<std::mutex> const componentLock(mComponentMutex);
        server = listener;
    }

    std::cout << "Service: Shutting down, draining for up to " << config.drainTimeout().count() << "ms" << std::endl;

    server->stopAccepting();
    auto result = server->drain(config.drainTimeout());

    if (result.timedOut) {
        std::cerr << "Service: Shutdown drain deadline passed, " << result.abandonedRequests
                  << " request(s) abandoned" << std::endl;
    }

    server.reset();
    releaseResources();

    lifecycle.transition(LifecycleState::Stopped);
    std::cout << "Service: Stopped after completing " << result.completedRequests << " request(s)" << std::endl;

    shutdownResult = result;
    return result;
}

auto LifecycleManager::state() const -> LifecycleState {
    return lifecycle.state();
}

auto LifecycleManager::port() const -> uint16_t {
    std::lock_guard<std::mutex> const lock(mComponentMutex);

    return boundPort;
}

auto LifecycleManager::mode() const -> HostingMode {
    return config.mode();
}

void LifecycleManager::releaseResources() {
    std::lock_guard<std::mutex> const lock(mComponentMutex);

    if (listener) {
        listener->stop();
        listener->join();
        listener.reset();
        vReleaseLog.emplace_back("listener");
    }

    if (router || routeTable) {
        router.reset();
        routeTable.reset();
        vReleaseLog.emplace_back("routes");
    }

    if (echoService) {
        echoService.reset();
        vReleaseLog.emplace_back("business logic");
    }

    if (dataStore) {
        dataStore.reset();
        vReleaseLog.emplace_back("data store");
    }
}
