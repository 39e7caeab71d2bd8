#ifndef DEVICE_LOCKS_H
#define DEVICE_LOCKS_H

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// One mutex per kernel device name. Bridge reconciliation and qdisc changes
// that touch the same device serialize; disjoint devices run in parallel.
class DeviceLocks {
public:
    // Holds every scope it was built with until destroyed.
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) = default;
        Guard& operator=(Guard&&) = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        size_t size() const { return locks_.size(); }

    private:
        friend class DeviceLocks;
        std::vector<std::shared_ptr<std::mutex>> mutexes_;
        std::vector<std::unique_lock<std::mutex>> locks_;
    };

    // Names are de-duplicated and taken in sorted order, so two callers
    // locking overlapping sets cannot deadlock.
    Guard lock(std::vector<std::string> names);

private:
    std::shared_ptr<std::mutex> mutexFor(const std::string& name);

    std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> table_;
};

#endif // DEVICE_LOCKS_H
