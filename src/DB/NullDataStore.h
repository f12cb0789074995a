//
// Store that keeps nothing. Selected with {"kind": "null"}
//

#ifndef ECHO_SERVICE_NULLDATASTORE_H
#define ECHO_SERVICE_NULLDATASTORE_H

#include <echo_service/Interfaces/IDataStore.h>

class NullDataStore : public IDataStore {
public:
    [[nodiscard]] auto get(const std::string & /*key*/) const -> std::optional<std::string> override {
        return std::nullopt;
    }

    void put(const std::string & /*key*/, const std::string & /*value*/) override {}

    auto remove(const std::string & /*key*/) -> bool override {
        return false;
    }

    auto incrementCounter(const std::string & /*key*/) -> uint64_t override {
        return 0;
    }
};

#endif //ECHO_SERVICE_NULLDATASTORE_H
