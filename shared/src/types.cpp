#include "uplink/types.hpp"

namespace uplink {

const char *to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::Pending:
            return "pending";
        case UploadStatus::Uploading:
            return "uploading";
        case UploadStatus::Retrying:
            return "retrying";
        case UploadStatus::Completed:
            return "completed";
        case UploadStatus::Failed:
            return "failed";
        case UploadStatus::Aborted:
            return "aborted";
    }
    return "unknown";
}

const char *to_string(NetworkStatus status) {
    switch (status) {
        case NetworkStatus::Online:
            return "online";
        case NetworkStatus::Offline:
            return "offline";
        case NetworkStatus::Slow:
            return "slow";
    }
    return "unknown";
}

UploadStatus parse_upload_status(const std::string &text) {
    if (text == "pending") return UploadStatus::Pending;
    if (text == "uploading") return UploadStatus::Uploading;
    if (text == "retrying") return UploadStatus::Retrying;
    if (text == "completed") return UploadStatus::Completed;
    if (text == "failed") return UploadStatus::Failed;
    if (text == "aborted") return UploadStatus::Aborted;
    throw std::invalid_argument("invalid_status: Unknown upload status: " + text);
}

void FileUploadTask::recordAttempt(const RetryAttempt &attempt) {
    this->retry_log.push_back(attempt);
    while (this->retry_log.size() > RETRY_LOG_CAPACITY) {
        this->retry_log.pop_front();
    }
}

bool UploadBatch::settled() const {
    if (this->completed_files + this->failed_files != this->total_files) {
        return false;
    }
    for (const auto &task : this->files) {
        if (!is_terminal(task.status)) {
            return false;
        }
    }
    return true;
}

std::size_t UploadBatch::activeCount() const {
    std::size_t n = 0;
    for (const auto &task : this->files) {
        if (is_active(task.status)) {
            n++;
        }
    }
    return n;
}

UploadFileProgress to_progress(const std::string &batch_id, std::size_t index, const FileUploadTask &task) {
    UploadFileProgress progress;
    progress.batch_id = batch_id;
    progress.index = index;
    progress.file_name = task.file_name;
    progress.file_size_bytes = task.file_size_bytes;
    progress.uploaded_bytes = task.uploaded_bytes;
    progress.status = task.status;
    progress.error = task.error;
    progress.retry_count = task.retry_count;
    progress.upload_speed_bps = task.upload_speed_bps;
    progress.eta_seconds = task.eta_seconds;
    progress.is_stalled = task.is_stalled;
    return progress;
}

UploadBatchProgress to_progress(const UploadBatch &batch) {
    UploadBatchProgress progress;
    progress.batch_id = batch.batch_id;
    progress.total_files = batch.total_files;
    progress.completed_files = batch.completed_files;
    progress.failed_files = batch.failed_files;
    progress.network_status = batch.network_status;
    progress.files.reserve(batch.files.size());
    for (std::size_t i = 0; i < batch.files.size(); ++i) {
        progress.files.push_back(to_progress(batch.batch_id, i, batch.files[i]));
    }
    return progress;
}

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace uplink
