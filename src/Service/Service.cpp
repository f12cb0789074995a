#include "../Lib/GeneralUtils.h"
#include "LifecycleManager.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <echo_service/Service.h>
#include <iostream>
#include <thread>

auto startService(const ServiceConfiguration &config) -> std::shared_ptr<IService> {
    auto service = std::make_shared<LifecycleManager>(config);
    service->wire();

    return service;
}

auto runService() -> int {
    std::shared_ptr<IService> service;

    try {
        service = startService(ServiceConfiguration::fromEnvironment());
    } catch (eConstructionError &e) {
        std::cerr << "Service: Unable to start - " << e.what() << std::endl;
        return 1;
    }

    // Signals are only one way of triggering a stop, the service itself knows nothing about them
    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([service](const boost::system::error_code &errorCode, int signalNumber) {
        if (errorCode) {
            return;
        }

        std::cout << "Service: Received signal " << signalNumber << ", stopping" << std::endl;
        service->stop();
    });

    std::thread signalThread([&signalContext] {
        signalContext.run();
    });

    int exitCode = 0;
    try {
        service->run();
    } catch (std::exception &e) {
        dumpExceptions(e);
        exitCode = 1;
    }

    // Stopped without a signal, stop waiting for one
    service->stop();
    signals.cancel();
    signalContext.stop();
    signalThread.join();

    return exitCode;
}
