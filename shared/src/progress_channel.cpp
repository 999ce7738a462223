#include "uplink/progress_channel.hpp"

#include <algorithm>

namespace uplink {

namespace {

bool is_byte_update(const ProgressEvent &event) {
    const auto *file = std::get_if<UploadFileProgress>(&event);
    return file != nullptr && file->byte_update;
}

} // namespace

ProgressSubscription::ProgressSubscription(std::size_t capacity) : capacity(capacity == 0 ? 1 : capacity) {
}

void ProgressSubscription::push(const ProgressEvent &event) {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->is_closed) {
            return;
        }
        if (this->queue.size() >= this->capacity) {
            auto victim = std::find_if(this->queue.begin(), this->queue.end(), is_byte_update);
            if (victim == this->queue.end()) {
                victim = this->queue.begin();
            }
            this->queue.erase(victim);
            this->dropped_count++;
        }
        this->queue.push_back(event);
    }
    this->cv.notify_one();
}

std::optional<ProgressEvent> ProgressSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->cv.wait_for(lock, timeout, [this] { return this->is_closed || !this->queue.empty(); });
    if (this->queue.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(this->queue.front());
    this->queue.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressSubscription::tryNext() {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->queue.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(this->queue.front());
    this->queue.pop_front();
    return event;
}

void ProgressSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->is_closed = true;
        this->queue.clear();
    }
    this->cv.notify_all();
}

bool ProgressSubscription::closed() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->is_closed;
}

std::size_t ProgressSubscription::dropped() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->dropped_count;
}

std::size_t ProgressSubscription::pending() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->queue.size();
}

std::shared_ptr<ProgressSubscription> ProgressChannel::subscribe(std::size_t capacity) {
    auto subscription = std::make_shared<ProgressSubscription>(capacity);
    std::lock_guard<std::mutex> lock(this->mutex);
    this->subscribers.push_back(subscription);
    return subscription;
}

void ProgressChannel::publish(const ProgressEvent &event) {
    std::vector<std::shared_ptr<ProgressSubscription>> live;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto it = this->subscribers.begin();
        while (it != this->subscribers.end()) {
            auto subscription = it->lock();
            if (!subscription || subscription->closed()) {
                it = this->subscribers.erase(it);
                continue;
            }
            live.push_back(std::move(subscription));
            ++it;
        }
    }
    for (const auto &subscription : live) {
        subscription->push(event);
    }
}

std::size_t ProgressChannel::subscriberCount() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::size_t n = 0;
    for (const auto &weak : this->subscribers) {
        auto subscription = weak.lock();
        if (subscription && !subscription->closed()) {
            n++;
        }
    }
    return n;
}

} // namespace uplink
