//
// Builds the configured data store implementation
//

#ifndef ECHO_SERVICE_DATASTOREFACTORY_H
#define ECHO_SERVICE_DATASTOREFACTORY_H

#include <echo_service/Interfaces/IDataStore.h>
#include <memory>
#include <nlohmann/json.hpp>

// Config shape:
//  {
//      "kind": "memory" | "null",      (default "memory")
//      "capacity": 1000,               (memory only, optional, 0 = unbounded)
//      "seed": {"key": "value", ...}   (memory only, optional)
//  }
//
// Throws eConstructionError if the config is not understood
auto createDataStore(const nlohmann::json &config) -> std::shared_ptr<IDataStore>;

#endif //ECHO_SERVICE_DATASTOREFACTORY_H
