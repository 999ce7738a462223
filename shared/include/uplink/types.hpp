#pragma once

#include "uplink/errors.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace uplink {

using Clock = std::chrono::steady_clock;

enum class UploadStatus { Pending, Uploading, Retrying, Completed, Failed, Aborted };

enum class NetworkStatus { Online, Offline, Slow };

const char *to_string(UploadStatus status);
const char *to_string(NetworkStatus status);
UploadStatus parse_upload_status(const std::string &text);

inline bool is_terminal(UploadStatus status) {
    return status == UploadStatus::Completed || status == UploadStatus::Failed || status == UploadStatus::Aborted;
}

inline bool is_active(UploadStatus status) {
    return status == UploadStatus::Uploading || status == UploadStatus::Retrying;
}

// one local file handed to submit()
struct UploadFile {
    std::filesystem::path path;
    std::string file_name;    // defaults to path.filename()
    std::string content_type; // defaults to application/octet-stream
    double duration_seconds = 0;
    std::map<std::string, std::string> metadata;
};

// destination fields shared by every file of a batch
struct DestinationMetadata {
    std::map<std::string, std::string> fields;
    std::vector<std::string> required_fields;
};

struct Authorization {
    std::string record_id;
    std::string object_key;
    std::string upload_url;
    std::string auth_token;
    std::string content_type;
    std::int64_t expires_in_seconds = 0;
};

struct RetryAttempt {
    int attempt_number = 0;
    std::int64_t timestamp_ms = 0;
    ErrorClass error_class = ErrorClass::TransientNetwork;
    std::string error;
    bool will_retry = false;
};

constexpr std::size_t RETRY_LOG_CAPACITY = 10;

struct FileUploadTask {
    std::string file_name;
    std::filesystem::path local_path;
    std::string content_type;
    double duration_seconds = 0;
    std::map<std::string, std::string> metadata;
    std::string record_id;

    std::uint64_t file_size_bytes = 0;
    std::uint64_t uploaded_bytes = 0;
    UploadStatus status = UploadStatus::Pending;
    std::string error;
    int retry_count = 0;
    double upload_speed_bps = 0;
    double eta_seconds = 0;
    bool is_stalled = false;
    std::string remote_object_key;
    std::deque<RetryAttempt> retry_log; // last RETRY_LOG_CAPACITY failed attempts
    bool attempted = false;

    void recordAttempt(const RetryAttempt &attempt);
};

struct UploadFileProgress {
    std::string batch_id;
    std::size_t index = 0;
    std::string file_name;
    std::uint64_t file_size_bytes = 0;
    std::uint64_t uploaded_bytes = 0;
    UploadStatus status = UploadStatus::Pending;
    std::string error;
    int retry_count = 0;
    double upload_speed_bps = 0;
    double eta_seconds = 0;
    bool is_stalled = false;
    bool byte_update = false; // true when only the byte counters changed
};

struct UploadBatchProgress {
    std::string batch_id;
    std::size_t total_files = 0;
    std::size_t completed_files = 0;
    std::size_t failed_files = 0;
    NetworkStatus network_status = NetworkStatus::Online;
    std::vector<UploadFileProgress> files;
};

struct UploadBatch {
    std::string batch_id;
    std::size_t total_files = 0;
    std::size_t completed_files = 0;
    std::size_t failed_files = 0;
    std::vector<FileUploadTask> files;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    NetworkStatus network_status = NetworkStatus::Online;

    bool settled() const;
    std::size_t activeCount() const;
};

struct BatchHandle {
    std::string batch_id;
};

UploadFileProgress to_progress(const std::string &batch_id, std::size_t index, const FileUploadTask &task);
UploadBatchProgress to_progress(const UploadBatch &batch);

std::int64_t now_ms();

} // namespace uplink
