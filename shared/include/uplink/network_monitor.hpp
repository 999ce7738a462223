#pragma once

#include "uplink/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace uplink {

// coarse connectivity state; offline always wins over slow
class NetworkMonitor {
public:
    using Listener = std::function<void(NetworkStatus)>;

    explicit NetworkMonitor(double slow_threshold_bps = 100 * 1024);

    NetworkStatus status() const;
    bool offline() const { return status() == NetworkStatus::Offline; }
    double lastSpeed() const;

    // OS-level connectivity signal
    void setOnline(bool online);
    // reads the interface table; returns the resulting online flag
    bool pollSystem();
    // measured throughput from any worker, last writer wins
    void recordThroughput(double bytes_per_second);

    std::uint64_t subscribe(Listener listener);
    void unsubscribe(std::uint64_t id);

private:
    void update(const std::function<void()> &mutation);

    mutable std::mutex mutex;
    bool online = true;
    double last_speed = 0;
    double slow_threshold;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, Listener> listeners;

    NetworkStatus statusLocked() const;
};

// true when a non-loopback interface is up and running
bool system_has_connectivity();

} // namespace uplink
