#pragma once

#include "uplink/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace uplink {

using ProgressEvent = std::variant<UploadFileProgress, UploadBatchProgress>;

// bounded queue drained by one subscriber
class ProgressSubscription {
public:
    explicit ProgressSubscription(std::size_t capacity);

    // waits up to `timeout`; empty when nothing arrived or the subscription is closed
    std::optional<ProgressEvent> next(std::chrono::milliseconds timeout);
    std::optional<ProgressEvent> tryNext();

    void close();
    bool closed() const;
    std::size_t dropped() const;
    std::size_t pending() const;

private:
    friend class ProgressChannel;

    // never blocks; evicts a byte-level event first when full
    void push(const ProgressEvent &event);

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<ProgressEvent> queue;
    std::size_t capacity;
    std::size_t dropped_count = 0;
    bool is_closed = false;
};

class ProgressChannel {
public:
    std::shared_ptr<ProgressSubscription> subscribe(std::size_t capacity = 1024);
    void publish(const ProgressEvent &event);
    std::size_t subscriberCount() const;

private:
    mutable std::mutex mutex;
    std::vector<std::weak_ptr<ProgressSubscription>> subscribers;
};

} // namespace uplink
