#pragma once

#include "uplink/cancel_token.hpp"
#include "uplink/config.hpp"
#include "uplink/hasher.hpp"
#include "uplink/network_monitor.hpp"
#include "uplink/retry_policy.hpp"
#include "uplink/transport.hpp"
#include "uplink/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace uplink {

constexpr std::chrono::milliseconds MIN_TRANSFER_TIMEOUT = std::chrono::minutes(5);

// called on every byte-level update and status transition of the task;
// calls for one task never overlap
using TaskCallback = std::function<void(const FileUploadTask &task, bool byte_update)>;

// fetches a fresh authorization for the task, throws UploadError on refusal
using AuthorizationRefresher = std::function<Authorization(const FileUploadTask &task)>;

// transfers one file's bytes with the attempt -> classify -> decide -> backoff loop
class FileTransferWorker {
public:
    FileTransferWorker(const UploadConfig &config, NetworkMonitor &monitor, ContentHasher &hasher,
                       ObjectTransport &transport, const RetryPolicy &policy,
                       AuthorizationRefresher refresher = nullptr);

    // returns the task in a terminal state; per-file errors never escape
    FileUploadTask upload(FileUploadTask task, Authorization authorization, const TaskCallback &on_progress, CancelToken &cancel);

    // one attempt; throws a classified UploadError on failure.
    // content_hash is computed on first use and reused by later attempts
    void uploadOnce(FileUploadTask &task, const Authorization &authorization, std::optional<std::string> &content_hash,
                    const TaskCallback &on_progress, CancelToken &cancel);

    static std::chrono::milliseconds transferTimeout(std::uint64_t size_bytes, std::int64_t timeout_per_megabyte_ms);

private:
    UploadConfig config;
    NetworkMonitor &monitor;
    ContentHasher &hasher;
    ObjectTransport &transport;
    const RetryPolicy &policy;
    AuthorizationRefresher refresher;
};

} // namespace uplink
