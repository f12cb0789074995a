#include "DataStoreFactory.h"
#include "InMemoryDataStore.h"
#include "NullDataStore.h"
#include <echo_service/Errors.h>
#include <string>

namespace {
auto createInMemoryDataStore(const nlohmann::json &config) -> std::shared_ptr<IDataStore> {
    std::size_t capacity = 0;
    if (config.contains("capacity")) {
        if (!config["capacity"].is_number_unsigned()) {
            throw eConstructionError("Data store capacity must be an unsigned integer");
        }
        capacity = config["capacity"].get<std::size_t>();
    }

    auto store = std::make_shared<InMemoryDataStore>(capacity);

    if (config.contains("seed")) {
        if (!config["seed"].is_object()) {
            throw eConstructionError("Data store seed must be an object of strings");
        }

        for (const auto &[key, value] : config["seed"].items()) {
            if (!value.is_string()) {
                throw eConstructionError("Data store seed value for " + key + " is not a string");
            }

            try {
                store->put(key, value.get<std::string>());
            } catch (eDataStoreError &e) {
                throw eConstructionError(std::string("Unable to seed data store: ") + e.what());
            }
        }
    }

    return store;
}
} // namespace

auto createDataStore(const nlohmann::json &config) -> std::shared_ptr<IDataStore> {
    if (!config.is_object()) {
        throw eConstructionError("Data store config must be a json object");
    }

    std::string kind = "memory";
    if (config.contains("kind")) {
        if (!config["kind"].is_string()) {
            throw eConstructionError("Data store kind must be a string");
        }
        kind = config["kind"].get<std::string>();
    }

    if (kind == "memory") {
        return createInMemoryDataStore(config);
    }

    if (kind == "null") {
        return std::make_shared<NullDataStore>();
    }

    throw eConstructionError("Unknown data store kind " + kind);
}
