#pragma once

#include "uplink/backend.hpp"
#include "uplink/cancel_token.hpp"
#include "uplink/config.hpp"
#include "uplink/file_transfer_worker.hpp"
#include "uplink/hasher.hpp"
#include "uplink/network_monitor.hpp"
#include "uplink/progress_channel.hpp"
#include "uplink/retry_policy.hpp"
#include "uplink/snapshot_store.hpp"
#include "uplink/transport.hpp"
#include "uplink/types.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uplink {

/**
 * Top-level orchestrator of direct-to-storage batch uploads.
 *
 * submit() validates the batch, creates one pending record per file and
 * requests authorizations; run() drives a pool of min(concurrency, files)
 * workers until every task is terminal. Progress is pushed to subscribers
 * through bounded queues, so callers never block the upload path.
 *
 * Collaborators are borrowed and must outlive the coordinator; the
 * coordinator must outlive every future returned by runAsync().
 */
class UploadCoordinator {
public:
    UploadCoordinator(const UploadConfig &config, RecordClient &records, AuthorizationClient &authorizer,
                      FinalizeClient &finalizer, NetworkMonitor &monitor, ObjectTransport &transport,
                      ContentHasher &hasher, SnapshotStore *snapshots = nullptr);
    ~UploadCoordinator();

    UploadCoordinator(const UploadCoordinator &) = delete;
    UploadCoordinator &operator=(const UploadCoordinator &) = delete;

    // throws ValidationError before any backend call when the batch is malformed
    BatchHandle submit(const std::vector<UploadFile> &files, const DestinationMetadata &destination);

    // blocks until every task is terminal; per-file failures are reported in the result
    UploadBatch run(const BatchHandle &handle);
    std::future<UploadBatch> runAsync(const BatchHandle &handle);

    // idempotent; unknown ids are ignored
    void cancel(const std::string &batch_id);

    // rebuilds an unfinished batch from its snapshot; completed files are kept
    BatchHandle resume(const std::string &batch_id);

    // releases a batch whose result has been consumed
    void close(const std::string &batch_id);

    std::shared_ptr<ProgressSubscription> subscribe(std::size_t capacity = 1024);

    std::optional<UploadBatch> batch(const std::string &batch_id) const;
    // unsettled batches with a fresh snapshot that can be passed to resume()
    std::vector<std::string> recoverable() const;
    std::size_t concurrencyFor(const UploadBatch &batch) const;
    const UploadConfig &config() const { return upload_config; }

private:
    struct BatchState;

    std::shared_ptr<BatchState> find(const std::string &batch_id) const;
    void validate(const std::vector<UploadFile> &files, const DestinationMetadata &destination) const;
    void authorizePending(BatchState &state);
    Authorization refreshAuthorization(BatchState &state, const FileUploadTask &task);
    void workerLoop(BatchState &state, FileTransferWorker &worker);
    void finalizeTask(FileUploadTask &task);

    // all of these expect state.mutex to be held
    void onTaskProgressLocked(BatchState &state, std::size_t index, const FileUploadTask &task, bool byte_update);
    void settleLocked(BatchState &state, std::size_t index, const FileUploadTask &task);
    void abortQueuedLocked(BatchState &state, const std::string &reason);
    void publishLocked(BatchState &state, std::size_t index, bool byte_update);
    void saveSnapshotLocked(BatchState &state);

    UploadConfig upload_config;
    RecordClient &records;
    AuthorizationClient &authorizer;
    FinalizeClient &finalizer;
    NetworkMonitor &monitor;
    ObjectTransport &transport;
    ContentHasher &hasher;
    SnapshotStore *snapshots;
    RetryPolicy policy;
    ProgressChannel channel;

    mutable std::mutex states_mutex;
    std::map<std::string, std::shared_ptr<BatchState>> states;
};

std::string guess_content_type(const std::filesystem::path &path);

} // namespace uplink
