#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace uplink {

struct UploadConfig {
    std::size_t batch_size = 50;           // max ids per authorization request
    std::size_t concurrency = 0;           // 0 -> recommended_concurrency()
    int retry_attempts = 3;
    std::int64_t retry_delay_base_ms = 1000;
    std::int64_t retry_delay_max_ms = 30000;
    std::int64_t timeout_per_megabyte_ms = 120000;
    std::int64_t stall_threshold_seconds = 30;
    std::int64_t stall_check_interval_ms = 5000;
    std::size_t chunk_size = 10 * 1024 * 1024; // reserved for chunked transfers
    double slow_threshold_bps = 100 * 1024;
    int expiration_hours = 24;
    std::uint64_t max_file_size_bytes = 500ull * 1024 * 1024;
    std::size_t max_batch_files = 80;
    int finalize_attempts = 3;
    int snapshot_freshness_hours = 24;

    // throws ValidationError when a value is out of range
    void validate() const;
};

// effective pool size for a batch, before clamping to the file count
std::size_t recommended_concurrency(std::size_t file_count, std::uint64_t total_bytes);

UploadConfig config_from_json(const nlohmann::json &doc);
nlohmann::json config_to_json(const UploadConfig &config);
UploadConfig load_config(const std::string &path);

} // namespace uplink
