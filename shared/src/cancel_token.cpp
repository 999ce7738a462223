#include "uplink/cancel_token.hpp"

#include <vector>

namespace uplink {

void CancelToken::cancel() {
    std::vector<Callback> to_run;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->is_cancelled) {
            return;
        }
        this->is_cancelled = true;
        for (auto &p : this->callbacks) {
            to_run.push_back(std::move(p.second));
        }
        this->callbacks.clear();
    }
    this->cv.notify_all();
    for (auto &callback : to_run) {
        callback();
    }
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->is_cancelled;
}

bool CancelToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(this->mutex);
    return !this->cv.wait_for(lock, duration, [this] { return this->is_cancelled; });
}

std::uint64_t CancelToken::onCancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->is_cancelled) {
            std::uint64_t id = this->next_id++;
            this->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancelToken::removeCallback(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->callbacks.erase(id);
}

CancelRegistration::CancelRegistration(CancelToken &token, CancelToken::Callback callback) : token(token) {
    this->id = token.onCancel(std::move(callback));
}

CancelRegistration::~CancelRegistration() {
    if (this->id != 0) {
        this->token.removeCallback(this->id);
    }
}

} // namespace uplink
