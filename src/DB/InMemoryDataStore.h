//
// Key/value store held in process memory
//

#ifndef ECHO_SERVICE_INMEMORYDATASTORE_H
#define ECHO_SERVICE_INMEMORYDATASTORE_H

#include <echo_service/Interfaces/IDataStore.h>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

class InMemoryDataStore : public IDataStore {
public:
    // A capacity of zero means unbounded
    explicit InMemoryDataStore(std::size_t capacity = 0);

    [[nodiscard]] auto get(const std::string &key) const -> std::optional<std::string> override;
    void put(const std::string &key, const std::string &value) override;
    auto remove(const std::string &key) -> bool override;
    auto incrementCounter(const std::string &key) -> uint64_t override;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    // Caller must hold mDataMutex
    void checkCapacityFor(const std::string &key) const;

    mutable std::mutex mDataMutex;
    std::map<std::string, std::string> mData;
    std::size_t capacity;
};

#endif //ECHO_SERVICE_INMEMORYDATASTORE_H
