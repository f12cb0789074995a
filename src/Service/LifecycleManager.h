//
// Service lifecycle manager
// The only place that sees the concrete business logic, data store and transport types
//

#ifndef ECHO_SERVICE_LIFECYCLEMANAGER_H
#define ECHO_SERVICE_LIFECYCLEMANAGER_H

#include "../Interfaces/IServer.h"
#include "../Lib/TestingMacros.h"
#include "Lifecycle.h"
#include <echo_service/Interfaces/IDataStore.h>
#include <echo_service/Interfaces/IEchoService.h>
#include <echo_service/Service.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class RouteTable;
class Router;

class LifecycleManager : public IService {
public:
    explicit LifecycleManager(ServiceConfiguration config);
    ~LifecycleManager() override;

    // Uninitialized -> Wiring -> Serving. On any failure everything built so far is released, the state
    // becomes Stopped and eConstructionError is thrown
    void wire();

    void run() override;
    auto stop() -> sShutdownResult override;

    [[nodiscard]] auto state() const -> LifecycleState override;
    [[nodiscard]] auto port() const -> uint16_t override;
    [[nodiscard]] auto mode() const -> HostingMode override;

private:
    void construct();

    // Listener, then route table and router, then business logic, then data store
    void releaseResources();

    const ServiceConfiguration config;
    Lifecycle lifecycle;

    // Guards the component pointers below against release while run() picks up the listener
    mutable std::mutex mComponentMutex;
    std::shared_ptr<IDataStore> dataStore;
    std::shared_ptr<IEchoService> echoService;
    std::shared_ptr<RouteTable> routeTable;
    std::shared_ptr<Router> router;
    std::shared_ptr<IServer> listener;
    uint16_t boundPort = 0;

    std::mutex mStopMutex;
    std::optional<sShutdownResult> shutdownResult;

    std::mutex mRunMutex;
    bool bRunCalled = false;

    std::vector<std::string> vReleaseLog;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(vReleaseLog);
};

#endif //ECHO_SERVICE_LIFECYCLEMANAGER_H
