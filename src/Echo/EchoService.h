//
// Echo business logic
//

#ifndef ECHO_SERVICE_ECHOSERVICE_H
#define ECHO_SERVICE_ECHOSERVICE_H

#include <echo_service/Interfaces/IDataStore.h>
#include <echo_service/Interfaces/IEchoService.h>
#include <memory>

class EchoService : public IEchoService {
public:
    explicit EchoService(std::shared_ptr<IDataStore> dataStore);

    auto execute(const sEchoRequest &request) -> sEchoResult override;

    // Throws eDomainError(InvalidInput) if the message can not be echoed
    static void validate(const std::string &message);

private:
    std::shared_ptr<IDataStore> dataStore;
};

#endif //ECHO_SERVICE_ECHOSERVICE_H
