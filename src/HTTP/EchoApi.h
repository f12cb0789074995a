//
// Registration of the echo route
//

#ifndef ECHO_SERVICE_ECHOAPI_H
#define ECHO_SERVICE_ECHOAPI_H

#include "RouteTable.h"
#include <echo_service/Interfaces/IEchoService.h>
#include <memory>
#include <string>

// GET <path>{message} -> 200 {"count": N, "message": "<message>"}
void EchoApi(const std::string &path, RouteTable &routes, const std::shared_ptr<IEchoService> &echoService);

#endif //ECHO_SERVICE_ECHOAPI_H
