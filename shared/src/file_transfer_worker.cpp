#include "uplink/file_transfer_worker.hpp"
#include "uplink/errors.hpp"
#include "uplink/log.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace uplink {

namespace {

constexpr std::chrono::seconds SPEED_SAMPLE_WINDOW(1);

// byte progress, speed sampling and stall state of one attempt
struct AttemptState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::uint64_t attempt_bytes = 0;
    Clock::time_point last_progress;
    Clock::time_point sample_time;
    std::uint64_t sample_bytes = 0;
};

// periodic stall check running beside the transfer
class StallWatch {
public:
    StallWatch(AttemptState &state, FileUploadTask &task, const TaskCallback &on_progress,
               std::chrono::milliseconds interval, std::chrono::seconds threshold)
        : state(state), task(task), on_progress(on_progress), interval(interval), threshold(threshold) {
        this->thread = std::thread(&StallWatch::run, this);
    }

    ~StallWatch() {
        {
            std::lock_guard<std::mutex> lock(this->state.mutex);
            this->state.done = true;
        }
        this->state.cv.notify_all();
        if (this->thread.joinable()) {
            this->thread.join();
        }
    }

    StallWatch(const StallWatch &) = delete;
    StallWatch &operator=(const StallWatch &) = delete;

private:
    void run() {
        std::unique_lock<std::mutex> lock(this->state.mutex);
        while (!this->state.done) {
            this->state.cv.wait_for(lock, this->interval, [this] { return this->state.done; });
            if (this->state.done) {
                break;
            }
            auto idle = Clock::now() - this->state.last_progress;
            if (idle > this->threshold && this->state.attempt_bytes > 0 && !this->task.is_stalled) {
                this->task.is_stalled = true;
                log_warning("upload stalled for ", this->task.file_name, " (",
                            std::chrono::duration_cast<std::chrono::seconds>(idle).count(), "s without progress)");
                if (this->on_progress) {
                    this->on_progress(this->task, false);
                }
            }
        }
    }

    AttemptState &state;
    FileUploadTask &task;
    const TaskCallback &on_progress;
    std::chrono::milliseconds interval;
    std::chrono::seconds threshold;
    std::thread thread;
};

void emit(const TaskCallback &on_progress, const FileUploadTask &task) {
    if (on_progress) {
        on_progress(task, false);
    }
}

} // namespace

FileTransferWorker::FileTransferWorker(const UploadConfig &config, NetworkMonitor &monitor, ContentHasher &hasher,
                                       ObjectTransport &transport, const RetryPolicy &policy,
                                       AuthorizationRefresher refresher)
    : config(config), monitor(monitor), hasher(hasher), transport(transport), policy(policy), refresher(std::move(refresher)) {
}

std::chrono::milliseconds FileTransferWorker::transferTimeout(std::uint64_t size_bytes, std::int64_t timeout_per_megabyte_ms) {
    double size_mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
    auto scaled = std::chrono::milliseconds(static_cast<std::int64_t>(size_mb * static_cast<double>(timeout_per_megabyte_ms)));
    return std::max<std::chrono::milliseconds>(MIN_TRANSFER_TIMEOUT, scaled);
}

void FileTransferWorker::uploadOnce(FileUploadTask &task, const Authorization &authorization, std::optional<std::string> &content_hash,
                                    const TaskCallback &on_progress, CancelToken &cancel) {
    // (1) offline is authoritative
    if (this->monitor.offline()) {
        throw OfflineError();
    }

    // (2) content identity
    if (!content_hash) {
        try {
            content_hash = this->hasher.hashFile(task.local_path);
        } catch (const UploadError &) {
            throw;
        } catch (const std::exception &e) {
            throw NonRetryableClientError("hash_failed: " + std::string(e.what()));
        }
    }

    // (3) streaming transfer with a size-scaled timeout
    TransferRequest request;
    request.local_path = task.local_path;
    request.size = task.file_size_bytes;
    request.authorization = authorization;
    request.content_hash = *content_hash;
    request.timeout = transferTimeout(task.file_size_bytes, this->config.timeout_per_megabyte_ms);
    task.remote_object_key = authorization.object_key;

    AttemptState state;
    state.last_progress = Clock::now();
    state.sample_time = state.last_progress;

    // (4) byte progress, 1 s throughput samples, eta
    BytesCallback on_bytes = [&](std::uint64_t sent) {
        std::lock_guard<std::mutex> lock(state.mutex);
        auto now = Clock::now();
        state.attempt_bytes = sent;
        state.last_progress = now;
        bool was_stalled = task.is_stalled;
        task.is_stalled = false;
        task.status = UploadStatus::Uploading;

        auto elapsed = now - state.sample_time;
        if (elapsed >= SPEED_SAMPLE_WINDOW) {
            double seconds = std::chrono::duration<double>(elapsed).count();
            double speed = static_cast<double>(sent - state.sample_bytes) / seconds;
            task.upload_speed_bps = speed;
            task.eta_seconds = speed > 0 ? static_cast<double>(task.file_size_bytes - sent) / speed : 0;
            this->monitor.recordThroughput(speed);
            state.sample_time = now;
            state.sample_bytes = sent;
            log_debug("progress ", task.file_name, ": ", sent, "/", task.file_size_bytes, " bytes at ", static_cast<std::uint64_t>(speed), " B/s");
        }

        // retries restart at zero; only report new high-water marks
        bool advanced = sent > task.uploaded_bytes;
        if (advanced) {
            task.uploaded_bytes = sent;
        }
        if (!on_progress) {
            return;
        }
        if (was_stalled) {
            on_progress(task, false); // stall cleared, a status-level change
        } else if (advanced) {
            on_progress(task, true);
        }
    };

    TransferResponse response;
    {
        // (5) advisory stall detection
        StallWatch watch(state, task, on_progress, std::chrono::milliseconds(this->config.stall_check_interval_ms),
                         std::chrono::seconds(this->config.stall_threshold_seconds));
        response = this->transport.put(request, on_bytes, cancel);
    }

    // (6) classify the outcome
    if (!response.ok()) {
        std::string reason = response.message.empty() ? "Object store rejected the upload" : response.message;
        throw_for_status(response.status, "http_" + std::to_string(response.status) + ": " + reason);
    }
}

FileUploadTask FileTransferWorker::upload(FileUploadTask task, Authorization authorization, const TaskCallback &on_progress, CancelToken &cancel) {
    std::optional<std::string> content_hash;
    bool needs_refresh = false; // set by a 401, cleared once a fresh authorization arrives
    task.attempted = true;

    while (true) {
        if (cancel.cancelled()) {
            task.status = UploadStatus::Aborted;
            task.error = "aborted: Upload aborted";
            task.upload_speed_bps = 0;
            task.eta_seconds = 0;
            emit(on_progress, task);
            return task;
        }

        task.status = task.retry_count > 0 ? UploadStatus::Retrying : UploadStatus::Uploading;
        task.is_stalled = false;
        emit(on_progress, task);
        log_info(task.retry_count > 0 ? "retry " + std::to_string(task.retry_count) : std::string("initial upload"), " for ", task.file_name);

        ErrorClass error_class = ErrorClass::TransientNetwork;
        std::string error_text;
        RetryVerdict verdict = RetryVerdict::Retry;
        try {
            if (needs_refresh) {
                authorization = this->refresher(task);
                needs_refresh = false;
                log_info("fetched fresh authorization for ", task.file_name);
            }
            this->uploadOnce(task, authorization, content_hash, on_progress, cancel);

            task.status = UploadStatus::Completed;
            task.uploaded_bytes = task.file_size_bytes;
            task.eta_seconds = 0;
            task.is_stalled = false;
            task.error.clear();
            task.retry_log.clear();
            log_info("upload completed for ", task.file_name, " with ", task.retry_count, " retries");
            emit(on_progress, task);
            return task;
        } catch (const UploadError &e) {
            error_class = e.errorClass();
            error_text = e.what();
            if (error_class == ErrorClass::AuthRefresh && !this->refresher) {
                verdict = RetryVerdict::NotRetryable;
            } else {
                verdict = this->policy.evaluate(e, task.retry_count, &cancel);
            }
        } catch (const std::exception &e) {
            error_class = ErrorClass::NonRetryableClient;
            error_text = "internal: " + std::string(e.what());
            verdict = cancel.cancelled() ? RetryVerdict::Cancelled : RetryVerdict::NotRetryable;
        }

        bool will_retry = verdict == RetryVerdict::Retry;
        task.recordAttempt(RetryAttempt{task.retry_count + 1, now_ms(), error_class, error_text, will_retry});
        task.upload_speed_bps = 0;
        task.eta_seconds = 0;
        task.is_stalled = false;
        log_warning("upload error for ", task.file_name, " (attempt ", task.retry_count + 1, "): ", error_text,
                    " [", to_string(error_class), ", ", to_string(verdict), "]");

        if (verdict == RetryVerdict::Cancelled) {
            task.status = UploadStatus::Aborted;
            task.error = "aborted: Upload aborted";
            emit(on_progress, task);
            return task;
        }
        if (!will_retry) {
            task.status = UploadStatus::Failed;
            if (verdict == RetryVerdict::Offline && error_class != ErrorClass::Offline) {
                task.error = "offline: Network went offline (last error: " + error_text + ")";
            } else {
                task.error = error_text;
            }
            emit(on_progress, task);
            return task;
        }
        if (error_class == ErrorClass::AuthRefresh) {
            needs_refresh = true;
        }

        auto delay = this->policy.computeDelay(task.retry_count);
        task.retry_count++;
        task.status = UploadStatus::Retrying;
        task.error = error_text;
        emit(on_progress, task);
        log_info("retrying ", task.file_name, " in ", delay.count(), "ms (attempt ", task.retry_count + 1, "/", this->policy.maxAttempts() + 1, ")");

        // a cancel during the backoff is handled at the top
        cancel.waitFor(delay);
    }
}

} // namespace uplink
