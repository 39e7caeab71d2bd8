#include "device_locks.h"

#include <algorithm>

DeviceLocks::Guard DeviceLocks::lock(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());

    Guard guard;
    guard.mutexes_.reserve(names.size());
    guard.locks_.reserve(names.size());
    for (const auto& name : names) {
        if (name.empty()) {
            continue;
        }
        // keep the mutex alive for as long as the guard holds it
        guard.mutexes_.push_back(mutexFor(name));
        guard.locks_.emplace_back(*guard.mutexes_.back());
    }
    return guard;
}

std::shared_ptr<std::mutex> DeviceLocks::mutexFor(const std::string& name) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& entry = table_[name];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}
