#include "uplink/config.hpp"
#include "uplink/errors.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <type_traits>

namespace uplink {

namespace {

constexpr std::uint64_t MB = 1024 * 1024;

template <typename T>
void read_number(const nlohmann::json &doc, const char *key, T &out) {
    if (!doc.contains(key)) {
        return;
    }
    const auto &value = doc.at(key);
    if (!value.is_number()) {
        throw ValidationError(std::string("invalid_config: '") + key + "' must be a number");
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (value.get<double>() < 0) {
            throw ValidationError(std::string("invalid_config: '") + key + "' must not be negative");
        }
        out = value.get<T>();
    } else {
        if (!value.is_number_integer()) {
            throw ValidationError(std::string("invalid_config: '") + key + "' must be an integer");
        }
        if (!value.is_number_unsigned() && value.get<std::int64_t>() < 0) {
            throw ValidationError(std::string("invalid_config: '") + key + "' must not be negative");
        }
        // non-negative from here on
        if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            throw ValidationError(std::string("invalid_config: '") + key + "' is out of range");
        }
        out = static_cast<T>(value.get<std::uint64_t>());
    }
}

} // namespace

void UploadConfig::validate() const {
    if (this->batch_size == 0) {
        throw ValidationError("invalid_config: batchSize must be >= 1");
    }
    if (this->retry_attempts < 0) {
        throw ValidationError("invalid_config: retryAttempts must be >= 0");
    }
    if (this->retry_delay_base_ms <= 0) {
        throw ValidationError("invalid_config: retryDelayBaseMs must be > 0");
    }
    if (this->retry_delay_max_ms < this->retry_delay_base_ms) {
        throw ValidationError("invalid_config: retryDelayMaxMs must be >= retryDelayBaseMs");
    }
    if (this->timeout_per_megabyte_ms <= 0) {
        throw ValidationError("invalid_config: timeoutPerMegabyteMs must be > 0");
    }
    if (this->stall_threshold_seconds <= 0) {
        throw ValidationError("invalid_config: stallThresholdSeconds must be >= 1");
    }
    if (this->stall_check_interval_ms <= 0) {
        throw ValidationError("invalid_config: stallCheckIntervalMs must be >= 1");
    }
    if (this->max_batch_files == 0) {
        throw ValidationError("invalid_config: maxBatchFiles must be >= 1");
    }
    if (this->finalize_attempts < 1) {
        throw ValidationError("invalid_config: finalizeAttempts must be >= 1");
    }
    if (this->expiration_hours < 1) {
        throw ValidationError("invalid_config: expirationHours must be >= 1");
    }
    if (this->snapshot_freshness_hours < 1) {
        throw ValidationError("invalid_config: snapshotFreshnessHours must be >= 1");
    }
}

std::size_t recommended_concurrency(std::size_t file_count, std::uint64_t total_bytes) {
    if (file_count == 0) {
        return 1;
    }
    // very large files: keep peak memory and socket buffers bounded
    if (total_bytes / file_count > 50 * MB) {
        return 2;
    }
    if (file_count <= 5) {
        return 3;
    }
    if (file_count <= 20) {
        return 4;
    }
    return 5;
}

UploadConfig config_from_json(const nlohmann::json &doc) {
    if (!doc.is_object()) {
        throw ValidationError("invalid_config: Configuration must be a JSON object");
    }
    UploadConfig config;
    read_number(doc, "batchSize", config.batch_size);
    read_number(doc, "concurrency", config.concurrency);
    read_number(doc, "retryAttempts", config.retry_attempts);
    read_number(doc, "retryDelayBaseMs", config.retry_delay_base_ms);
    read_number(doc, "retryDelayMaxMs", config.retry_delay_max_ms);
    read_number(doc, "timeoutPerMegabyteMs", config.timeout_per_megabyte_ms);
    read_number(doc, "stallThresholdSeconds", config.stall_threshold_seconds);
    read_number(doc, "stallCheckIntervalMs", config.stall_check_interval_ms);
    read_number(doc, "chunkSize", config.chunk_size);
    read_number(doc, "slowThresholdBps", config.slow_threshold_bps);
    read_number(doc, "expirationHours", config.expiration_hours);
    read_number(doc, "maxFileSizeBytes", config.max_file_size_bytes);
    read_number(doc, "maxBatchFiles", config.max_batch_files);
    read_number(doc, "finalizeAttempts", config.finalize_attempts);
    read_number(doc, "snapshotFreshnessHours", config.snapshot_freshness_hours);
    config.validate();
    return config;
}

nlohmann::json config_to_json(const UploadConfig &config) {
    return nlohmann::json{
        {"batchSize", config.batch_size},
        {"concurrency", config.concurrency},
        {"retryAttempts", config.retry_attempts},
        {"retryDelayBaseMs", config.retry_delay_base_ms},
        {"retryDelayMaxMs", config.retry_delay_max_ms},
        {"timeoutPerMegabyteMs", config.timeout_per_megabyte_ms},
        {"stallThresholdSeconds", config.stall_threshold_seconds},
        {"stallCheckIntervalMs", config.stall_check_interval_ms},
        {"chunkSize", config.chunk_size},
        {"slowThresholdBps", config.slow_threshold_bps},
        {"expirationHours", config.expiration_hours},
        {"maxFileSizeBytes", config.max_file_size_bytes},
        {"maxBatchFiles", config.max_batch_files},
        {"finalizeAttempts", config.finalize_attempts},
        {"snapshotFreshnessHours", config.snapshot_freshness_hours},
    };
}

UploadConfig load_config(const std::string &path) {
    if (!std::filesystem::exists(path)) {
        throw ValidationError("invalid_config: Config file does not exist (path: " + path + ")");
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("file_open_failed: Could not open config file for reading (path: " + path + ")");
    }
    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::parse_error &e) {
        throw ValidationError("invalid_config: " + std::string(e.what()));
    }
    return config_from_json(doc);
}

} // namespace uplink
