#pragma once

#include "uplink/cancel_token.hpp"
#include "uplink/config.hpp"
#include "uplink/errors.hpp"
#include "uplink/network_monitor.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <random>

namespace uplink {

constexpr double JITTER_MIN = 0.85;
constexpr double JITTER_MAX = 1.15;

enum class RetryVerdict { Retry, Exhausted, NotRetryable, Cancelled, Offline };

const char *to_string(RetryVerdict verdict);

class RetryPolicy {
public:
    using JitterSource = std::function<double()>;

    RetryPolicy(const UploadConfig &config, const NetworkMonitor &monitor);
    // jitter must return values in [JITTER_MIN, JITTER_MAX]
    RetryPolicy(const UploadConfig &config, const NetworkMonitor &monitor, JitterSource jitter);

    // attempt_number counts the retries already made for this file
    RetryVerdict evaluate(const UploadError &error, int attempt_number, const CancelToken *cancel = nullptr) const;
    bool shouldRetry(const UploadError &error, int attempt_number, const CancelToken *cancel = nullptr) const;

    // min(maxDelay, baseDelay * 2^attempt_number * jitter)
    std::chrono::milliseconds computeDelay(int attempt_number) const;

    int maxAttempts() const { return retry_attempts; }

private:
    int retry_attempts;
    std::int64_t base_delay_ms;
    std::int64_t max_delay_ms;
    const NetworkMonitor &monitor;
    JitterSource jitter;

    mutable std::mutex rng_mutex;
    mutable std::mt19937 rng;
};

} // namespace uplink
