#include "uplink/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace uplink {

const char *to_string(RetryVerdict verdict) {
    switch (verdict) {
        case RetryVerdict::Retry:
            return "retry";
        case RetryVerdict::Exhausted:
            return "exhausted";
        case RetryVerdict::NotRetryable:
            return "not_retryable";
        case RetryVerdict::Cancelled:
            return "cancelled";
        case RetryVerdict::Offline:
            return "offline";
    }
    return "unknown";
}

RetryPolicy::RetryPolicy(const UploadConfig &config, const NetworkMonitor &monitor)
    : RetryPolicy(config, monitor, nullptr) {
}

RetryPolicy::RetryPolicy(const UploadConfig &config, const NetworkMonitor &monitor, JitterSource jitter)
    : retry_attempts(config.retry_attempts),
      base_delay_ms(config.retry_delay_base_ms),
      max_delay_ms(config.retry_delay_max_ms),
      monitor(monitor),
      jitter(std::move(jitter)),
      rng(std::random_device{}()) {
    if (!this->jitter) {
        this->jitter = [this] {
            std::uniform_real_distribution<double> dist(JITTER_MIN, JITTER_MAX);
            std::lock_guard<std::mutex> lock(this->rng_mutex);
            return dist(this->rng);
        };
    }
}

RetryVerdict RetryPolicy::evaluate(const UploadError &error, int attempt_number, const CancelToken *cancel) const {
    if (error.errorClass() == ErrorClass::Cancelled || (cancel != nullptr && cancel->cancelled())) {
        return RetryVerdict::Cancelled;
    }
    if (error.errorClass() == ErrorClass::Offline || this->monitor.offline()) {
        return RetryVerdict::Offline;
    }
    if (!error.retryable()) {
        return RetryVerdict::NotRetryable;
    }
    if (attempt_number >= this->retry_attempts) {
        return RetryVerdict::Exhausted;
    }
    return RetryVerdict::Retry;
}

bool RetryPolicy::shouldRetry(const UploadError &error, int attempt_number, const CancelToken *cancel) const {
    return this->evaluate(error, attempt_number, cancel) == RetryVerdict::Retry;
}

std::chrono::milliseconds RetryPolicy::computeDelay(int attempt_number) const {
    double factor = std::clamp(this->jitter(), JITTER_MIN, JITTER_MAX);
    // 2^n overflows long before it matters; cap the exponent
    int exponent = std::clamp(attempt_number, 0, 30);
    double delay = static_cast<double>(this->base_delay_ms) * std::ldexp(1.0, exponent) * factor;
    delay = std::min(delay, static_cast<double>(this->max_delay_ms));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::ceil(delay)));
}

} // namespace uplink
