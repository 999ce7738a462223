#include "uplink/network_monitor.hpp"
#include "uplink/log.hpp"

#include <ifaddrs.h>
#include <net/if.h>

#include <vector>

namespace uplink {

NetworkMonitor::NetworkMonitor(double slow_threshold_bps) : slow_threshold(slow_threshold_bps) {
}

NetworkStatus NetworkMonitor::statusLocked() const {
    if (!this->online) {
        return NetworkStatus::Offline;
    }
    if (this->last_speed > 0 && this->last_speed < this->slow_threshold) {
        return NetworkStatus::Slow;
    }
    return NetworkStatus::Online;
}

NetworkStatus NetworkMonitor::status() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->statusLocked();
}

double NetworkMonitor::lastSpeed() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->last_speed;
}

void NetworkMonitor::setOnline(bool online) {
    this->update([this, online] { this->online = online; });
}

bool NetworkMonitor::pollSystem() {
    bool online = system_has_connectivity();
    this->setOnline(online);
    return online;
}

void NetworkMonitor::recordThroughput(double bytes_per_second) {
    this->update([this, bytes_per_second] { this->last_speed = bytes_per_second; });
}

std::uint64_t NetworkMonitor::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::uint64_t id = this->next_id++;
    this->listeners.emplace(id, std::move(listener));
    return id;
}

void NetworkMonitor::unsubscribe(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->listeners.erase(id);
}

void NetworkMonitor::update(const std::function<void()> &mutation) {
    std::vector<Listener> to_notify;
    NetworkStatus after;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        NetworkStatus before = this->statusLocked();
        mutation();
        after = this->statusLocked();
        if (before == after) {
            return;
        }
        for (const auto &p : this->listeners) {
            to_notify.push_back(p.second);
        }
    }
    log_info("network status changed to ", to_string(after));
    for (const auto &listener : to_notify) {
        listener(after);
    }
}

bool system_has_connectivity() {
    struct ifaddrs *addrs = nullptr;
    if (::getifaddrs(&addrs) != 0) {
        // cannot tell; do not block uploads on a failed probe
        return true;
    }
    bool found = false;
    for (struct ifaddrs *ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) {
            continue;
        }
        unsigned int flags = ifa->ifa_flags;
        if ((flags & IFF_LOOPBACK) != 0) {
            continue;
        }
        if ((flags & IFF_UP) != 0 && (flags & IFF_RUNNING) != 0) {
            found = true;
            break;
        }
    }
    ::freeifaddrs(addrs);
    return found;
}

} // namespace uplink
