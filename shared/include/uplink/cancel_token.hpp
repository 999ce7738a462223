#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace uplink {

// cooperative cancellation shared by every task of a batch
class CancelToken {
public:
    using Callback = std::function<void()>;

    // idempotent; runs registered callbacks once, outside the lock
    void cancel();
    bool cancelled() const;

    // sleeps up to `duration`; returns false when woken by cancellation
    bool waitFor(std::chrono::milliseconds duration) const;

    // callback runs immediately if the token is already cancelled
    std::uint64_t onCancel(Callback callback);
    void removeCallback(std::uint64_t id);

private:
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    bool is_cancelled = false;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, Callback> callbacks;
};

// scoped registration of an abort hook for the duration of one transfer
class CancelRegistration {
public:
    CancelRegistration(CancelToken &token, CancelToken::Callback callback);
    ~CancelRegistration();

    CancelRegistration(const CancelRegistration &) = delete;
    CancelRegistration &operator=(const CancelRegistration &) = delete;

private:
    CancelToken &token;
    std::uint64_t id;
};

} // namespace uplink
