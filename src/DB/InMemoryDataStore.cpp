#include "InMemoryDataStore.h"
#include <echo_service/Errors.h>
#include <stdexcept>

InMemoryDataStore::InMemoryDataStore(std::size_t capacity) : capacity(capacity) {}

auto InMemoryDataStore::get(const std::string &key) const -> std::optional<std::string> {
    std::lock_guard<std::mutex> const lock(mDataMutex);

    auto entry = mData.find(key);
    if (entry == mData.end()) {
        return std::nullopt;
    }

    return entry->second;
}

void InMemoryDataStore::put(const std::string &key, const std::string &value) {
    std::lock_guard<std::mutex> const lock(mDataMutex);

    checkCapacityFor(key);
    mData[key] = value;
}

auto InMemoryDataStore::remove(const std::string &key) -> bool {
    std::lock_guard<std::mutex> const lock(mDataMutex);

    return mData.erase(key) != 0;
}

auto InMemoryDataStore::incrementCounter(const std::string &key) -> uint64_t {
    std::lock_guard<std::mutex> const lock(mDataMutex);

    uint64_t value = 0;

    auto entry = mData.find(key);
    if (entry != mData.end()) {
        try {
            std::size_t consumed = 0;
            value = std::stoull(entry->second, &consumed);
            if (consumed != entry->second.size()) {
                throw std::invalid_argument(entry->second);
            }
        } catch (std::logic_error &) {
            throw eDataStoreError("Value stored under " + key + " is not a counter");
        }
    } else {
        checkCapacityFor(key);
    }

    mData[key] = std::to_string(++value);
    return value;
}

auto InMemoryDataStore::size() const -> std::size_t {
    std::lock_guard<std::mutex> const lock(mDataMutex);

    return mData.size();
}

void InMemoryDataStore::checkCapacityFor(const std::string &key) const {
    if (capacity != 0 && mData.size() >= capacity && mData.find(key) == mData.end()) {
        throw eDataStoreError("Data store is full (capacity " + std::to_string(capacity) + ")");
    }
}
