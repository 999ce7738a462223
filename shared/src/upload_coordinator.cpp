#include "uplink/upload_coordinator.hpp"
#include "uplink/errors.hpp"
#include "uplink/log.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <thread>

namespace uplink {

namespace fs = std::filesystem;

struct UploadCoordinator::BatchState {
    std::mutex mutex;
    UploadBatch batch;
    DestinationMetadata destination;
    std::map<std::size_t, Authorization> authorizations;
    CancelToken cancel;
    bool running = false;
    std::size_t next_index = 0;
};

namespace {

std::string join(const std::vector<std::string> &parts, const std::string &sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

std::map<std::string, std::string> merged_metadata(const DestinationMetadata &destination, const UploadFile &file) {
    auto merged = destination.fields;
    for (const auto &[key, value] : file.metadata) {
        merged[key] = value;
    }
    return merged;
}

// back to a fresh pending task, keeping its record and identity
void reset_for_resume(FileUploadTask &task) {
    task.status = UploadStatus::Pending;
    task.uploaded_bytes = 0;
    task.error.clear();
    task.retry_count = 0;
    task.upload_speed_bps = 0;
    task.eta_seconds = 0;
    task.is_stalled = false;
    task.retry_log.clear();
    task.attempted = false;
}

} // namespace

std::string guess_content_type(const fs::path &path) {
    static const std::map<std::string, std::string> types = {
        {".mp3", "audio/mpeg"}, {".m4a", "audio/mp4"}, {".wav", "audio/wav"},   {".ogg", "audio/ogg"},
        {".flac", "audio/flac"}, {".mp4", "video/mp4"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
        {".png", "image/png"},  {".pdf", "application/pdf"}, {".json", "application/json"}, {".txt", "text/plain"},
    };
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

UploadCoordinator::UploadCoordinator(const UploadConfig &config, RecordClient &records, AuthorizationClient &authorizer,
                                     FinalizeClient &finalizer, NetworkMonitor &monitor, ObjectTransport &transport,
                                     ContentHasher &hasher, SnapshotStore *snapshots)
    : upload_config(config), records(records), authorizer(authorizer), finalizer(finalizer), monitor(monitor),
      transport(transport), hasher(hasher), snapshots(snapshots), policy(config, monitor) {
    this->upload_config.validate();
    if (this->snapshots != nullptr) {
        std::size_t dropped = this->snapshots->purgeStale();
        if (dropped > 0) {
            log_info("[snapshot] dropped ", dropped, " stale snapshot(s)");
        }
        auto ids = this->recoverable();
        if (!ids.empty()) {
            log_info("[snapshot] ", ids.size(), " unfinished batch(es) can be resumed");
        }
    }
}

UploadCoordinator::~UploadCoordinator() {
    std::lock_guard<std::mutex> lock(this->states_mutex);
    for (auto &[id, state] : this->states) {
        state->cancel.cancel();
    }
}

std::shared_ptr<UploadCoordinator::BatchState> UploadCoordinator::find(const std::string &batch_id) const {
    std::lock_guard<std::mutex> lock(this->states_mutex);
    auto it = this->states.find(batch_id);
    return it == this->states.end() ? nullptr : it->second;
}

void UploadCoordinator::validate(const std::vector<UploadFile> &files, const DestinationMetadata &destination) const {
    std::vector<std::string> errors;
    if (files.empty()) {
        errors.push_back("No files provided for upload");
    }
    if (files.size() > this->upload_config.max_batch_files) {
        errors.push_back("Maximum " + std::to_string(this->upload_config.max_batch_files) + " files allowed per batch");
    }
    for (std::size_t i = 0; i < files.size(); ++i) {
        const auto &file = files[i];
        std::string prefix = "File " + std::to_string(i + 1) + ": ";
        std::error_code ec;
        if (file.path.empty()) {
            errors.push_back(prefix + "File path is required");
        } else if (!fs::is_regular_file(file.path, ec)) {
            errors.push_back(prefix + "File not found (path: " + file.path.string() + ")");
        } else {
            auto size = fs::file_size(file.path, ec);
            if (ec) {
                errors.push_back(prefix + "Could not read file size (" + ec.message() + ")");
            } else if (size == 0) {
                errors.push_back(prefix + "File is empty");
            } else if (size > this->upload_config.max_file_size_bytes) {
                errors.push_back(prefix + "File size exceeds limit of " +
                                 std::to_string(this->upload_config.max_file_size_bytes) + " bytes");
            }
        }
        auto metadata = merged_metadata(destination, file);
        for (const auto &field : destination.required_fields) {
            if (field == "duration_seconds") {
                if (!(file.duration_seconds > 0)) {
                    errors.push_back(prefix + "Valid duration is required");
                }
                continue;
            }
            auto it = metadata.find(field);
            if (it == metadata.end() || it->second.empty()) {
                errors.push_back(prefix + field + " is required");
            }
        }
    }
    if (!errors.empty()) {
        throw ValidationError("validation_failed: " + join(errors, "; "));
    }
}

BatchHandle UploadCoordinator::submit(const std::vector<UploadFile> &files, const DestinationMetadata &destination) {
    this->validate(files, destination);

    auto state = std::make_shared<BatchState>();
    state->destination = destination;
    state->batch.batch_id = random_hex(16);
    state->batch.total_files = files.size();
    state->batch.network_status = this->monitor.status();
    for (const auto &file : files) {
        FileUploadTask task;
        task.local_path = file.path;
        task.file_name = file.file_name.empty() ? file.path.filename().string() : file.file_name;
        task.content_type = file.content_type.empty() ? guess_content_type(file.path) : file.content_type;
        task.duration_seconds = file.duration_seconds;
        task.metadata = merged_metadata(destination, file);
        task.file_size_bytes = fs::file_size(file.path);
        state->batch.files.push_back(std::move(task));
    }

    auto ids = this->records.createPending(state->batch.batch_id, state->batch.files);
    if (ids.size() != state->batch.files.size()) {
        throw NonRetryableClientError("record_creation_failed: Expected " + std::to_string(state->batch.files.size()) +
                                      " record ids, got " + std::to_string(ids.size()));
    }
    for (std::size_t i = 0; i < ids.size(); ++i) {
        state->batch.files[i].record_id = ids[i];
    }
    log_info("[batch ", state->batch.batch_id, "] created ", ids.size(), " pending record(s)");

    this->authorizePending(*state);
    {
        std::lock_guard<std::mutex> lock(this->states_mutex);
        this->states[state->batch.batch_id] = state;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    this->saveSnapshotLocked(*state);
    this->channel.publish(to_progress(state->batch));
    return BatchHandle{state->batch.batch_id};
}

void UploadCoordinator::authorizePending(BatchState &state) {
    std::vector<std::size_t> pending;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        for (std::size_t i = 0; i < state.batch.files.size(); ++i) {
            if (state.batch.files[i].status == UploadStatus::Pending) {
                pending.push_back(i);
            }
        }
    }

    for (std::size_t start = 0; start < pending.size(); start += this->upload_config.batch_size) {
        std::size_t end = std::min(pending.size(), start + this->upload_config.batch_size);
        std::vector<std::string> ids;
        for (std::size_t k = start; k < end; ++k) {
            ids.push_back(state.batch.files[pending[k]].record_id);
        }

        AuthorizationMap outcomes;
        std::string chunk_error;
        try {
            outcomes = this->authorizer.authorize(state.batch.batch_id, ids, this->upload_config.expiration_hours);
        } catch (const std::exception &e) {
            chunk_error = e.what();
            log_error("[batch ", state.batch.batch_id, "] authorization request failed: ", chunk_error);
        }

        std::lock_guard<std::mutex> lock(state.mutex);
        for (std::size_t k = start; k < end; ++k) {
            std::size_t index = pending[k];
            FileUploadTask task = state.batch.files[index];
            if (!chunk_error.empty()) {
                task.status = UploadStatus::Failed;
                task.error = chunk_error;
                this->settleLocked(state, index, task);
                continue;
            }
            auto it = outcomes.find(task.record_id);
            if (it == outcomes.end() || !it->second.authorization) {
                std::string reason = it == outcomes.end() ? "missing_authorization" : it->second.error;
                task.status = UploadStatus::Failed;
                task.error = "authorization_failed: " + reason;
                log_warning("[", task.file_name, "] not authorized: ", reason);
                this->settleLocked(state, index, task);
                continue;
            }
            state.authorizations[index] = *it->second.authorization;
            state.batch.files[index].remote_object_key = it->second.authorization->object_key;
        }
    }
}

Authorization UploadCoordinator::refreshAuthorization(BatchState &state, const FileUploadTask &task) {
    auto outcomes = this->authorizer.authorize(state.batch.batch_id, {task.record_id}, this->upload_config.expiration_hours);
    auto it = outcomes.find(task.record_id);
    if (it == outcomes.end() || !it->second.authorization) {
        std::string reason = it == outcomes.end() ? "missing_authorization" : it->second.error;
        throw AuthorizationError("authorization_failed: " + reason);
    }
    std::size_t index = 0;
    std::lock_guard<std::mutex> lock(state.mutex);
    for (; index < state.batch.files.size(); ++index) {
        if (state.batch.files[index].record_id == task.record_id) {
            state.authorizations[index] = *it->second.authorization;
            break;
        }
    }
    return *it->second.authorization;
}

std::size_t UploadCoordinator::concurrencyFor(const UploadBatch &batch) const {
    if (this->upload_config.concurrency > 0) {
        return this->upload_config.concurrency;
    }
    std::uint64_t total = 0;
    for (const auto &task : batch.files) {
        total += task.file_size_bytes;
    }
    return recommended_concurrency(batch.files.size(), total);
}

UploadBatch UploadCoordinator::run(const BatchHandle &handle) {
    auto state = this->find(handle.batch_id);
    if (!state) {
        throw ValidationError("unknown_batch: No such batch (id: " + handle.batch_id + ")");
    }

    std::size_t pool_size = 0;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->running) {
            throw std::runtime_error("batch_running: Batch is already running (id: " + handle.batch_id + ")");
        }
        if (state->batch.settled()) {
            if (state->batch.end_time == std::chrono::system_clock::time_point{}) {
                state->batch.start_time = state->batch.end_time = std::chrono::system_clock::now();
            }
            return state->batch;
        }
        std::size_t queued = 0;
        for (const auto &task : state->batch.files) {
            if (task.status == UploadStatus::Pending && !task.attempted) {
                queued++;
            }
        }
        pool_size = std::min(this->concurrencyFor(state->batch), queued);
        state->running = true;
        state->next_index = 0;
        state->batch.start_time = std::chrono::system_clock::now();
    }
    log_info("[batch ", handle.batch_id, "] starting ", pool_size, " worker(s)");

    FileTransferWorker worker(this->upload_config, this->monitor, this->hasher, this->transport, this->policy,
                              [this, &state](const FileUploadTask &task) { return this->refreshAuthorization(*state, task); });

    std::vector<std::thread> pool;
    for (std::size_t i = 0; i < pool_size; ++i) {
        pool.emplace_back([this, &state, &worker] { this->workerLoop(*state, worker); });
    }
    for (auto &thread : pool) {
        thread.join();
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    // covers a cancel that raced the last worker out of the queue
    if (state->cancel.cancelled()) {
        this->abortQueuedLocked(*state, "aborted: Upload aborted");
    }
    state->running = false;
    state->batch.end_time = std::chrono::system_clock::now();
    state->batch.network_status = this->monitor.status();
    this->saveSnapshotLocked(*state);
    this->channel.publish(to_progress(state->batch));
    log_info("[batch ", handle.batch_id, "] finished: ", state->batch.completed_files, "/", state->batch.total_files,
             " completed, ", state->batch.failed_files, " failed");
    return state->batch;
}

std::future<UploadBatch> UploadCoordinator::runAsync(const BatchHandle &handle) {
    return std::async(std::launch::async, [this, handle] { return this->run(handle); });
}

void UploadCoordinator::workerLoop(BatchState &state, FileTransferWorker &worker) {
    while (true) {
        std::size_t index = 0;
        FileUploadTask task;
        Authorization authorization;
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (state.cancel.cancelled()) {
                this->abortQueuedLocked(state, "aborted: Upload aborted");
                return;
            }
            auto &files = state.batch.files;
            while (state.next_index < files.size() &&
                   (files[state.next_index].status != UploadStatus::Pending || files[state.next_index].attempted)) {
                state.next_index++;
            }
            if (state.next_index >= files.size()) {
                return;
            }
            index = state.next_index++;
            files[index].attempted = true;
            task = files[index];
            authorization = state.authorizations.at(index);
        }

        auto on_progress = [this, &state, index](const FileUploadTask &update, bool byte_update) {
            // terminal states go through settleLocked, after finalize for completed files
            if (is_terminal(update.status)) {
                return;
            }
            std::lock_guard<std::mutex> lock(state.mutex);
            this->onTaskProgressLocked(state, index, update, byte_update);
        };
        FileUploadTask result = worker.upload(std::move(task), authorization, on_progress, state.cancel);
        if (result.status == UploadStatus::Completed) {
            this->finalizeTask(result);
        }
        std::lock_guard<std::mutex> lock(state.mutex);
        this->settleLocked(state, index, result);
    }
}

void UploadCoordinator::finalizeTask(FileUploadTask &task) {
    for (int attempt = 0;; ++attempt) {
        try {
            auto result = this->finalizer.finalize(task.record_id, task.file_size_bytes, task.duration_seconds);
            log_debug("[", task.file_name, "] finalized record ", task.record_id,
                      result.already_finalized ? " (already finalized)" : "");
            return;
        } catch (const UploadError &e) {
            if (!e.retryable() || attempt + 1 >= this->upload_config.finalize_attempts) {
                log_error("[", task.file_name, "] finalize failed: ", e.what());
                task.status = UploadStatus::Failed;
                task.error = std::string("finalize_failed: ") + e.what();
                return;
            }
            log_warning("[", task.file_name, "] finalize attempt ", attempt + 1, " failed: ", e.what());
            std::this_thread::sleep_for(this->policy.computeDelay(attempt));
        } catch (const std::exception &e) {
            log_error("[", task.file_name, "] finalize failed: ", e.what());
            task.status = UploadStatus::Failed;
            task.error = std::string("finalize_failed: ") + e.what();
            return;
        }
    }
}

void UploadCoordinator::onTaskProgressLocked(BatchState &state, std::size_t index, const FileUploadTask &task,
                                             bool byte_update) {
    auto &slot = state.batch.files[index];
    bool transition = slot.status != task.status || slot.is_stalled != task.is_stalled || slot.retry_count != task.retry_count;
    slot = task;
    slot.attempted = true;
    if (transition) {
        this->saveSnapshotLocked(state);
    }
    this->publishLocked(state, index, byte_update && !transition);
}

void UploadCoordinator::settleLocked(BatchState &state, std::size_t index, const FileUploadTask &task) {
    auto &slot = state.batch.files[index];
    if (is_terminal(slot.status)) {
        // already counted; a terminal task never changes again
        return;
    }
    slot = task;
    if (task.status == UploadStatus::Completed) {
        state.batch.completed_files++;
    } else {
        state.batch.failed_files++;
    }
    this->saveSnapshotLocked(state);
    this->publishLocked(state, index, false);
}

void UploadCoordinator::abortQueuedLocked(BatchState &state, const std::string &reason) {
    for (std::size_t i = 0; i < state.batch.files.size(); ++i) {
        const auto &current = state.batch.files[i];
        if (current.status != UploadStatus::Pending || current.attempted) {
            continue;
        }
        FileUploadTask task = current;
        task.status = UploadStatus::Aborted;
        task.error = reason;
        this->settleLocked(state, i, task);
    }
}

void UploadCoordinator::publishLocked(BatchState &state, std::size_t index, bool byte_update) {
    state.batch.network_status = this->monitor.status();
    auto file = to_progress(state.batch.batch_id, index, state.batch.files[index]);
    file.byte_update = byte_update;
    this->channel.publish(file);
    this->channel.publish(to_progress(state.batch));
}

void UploadCoordinator::saveSnapshotLocked(BatchState &state) {
    if (this->snapshots == nullptr) {
        return;
    }
    BatchSnapshot snapshot;
    snapshot.batch_id = state.batch.batch_id;
    snapshot.timestamp_ms = now_ms();
    snapshot.destination = state.destination;
    snapshot.files = state.batch.files;
    try {
        this->snapshots->save(snapshot);
    } catch (const std::exception &e) {
        // persistence loss must not fail the uploads themselves
        log_warning("[snapshot] could not save batch ", snapshot.batch_id, ": ", e.what());
    }
}

void UploadCoordinator::cancel(const std::string &batch_id) {
    auto state = this->find(batch_id);
    if (!state) {
        log_debug("[batch ", batch_id, "] cancel ignored, unknown batch");
        return;
    }
    if (!state->cancel.cancelled()) {
        log_info("[batch ", batch_id, "] cancelling");
    }
    // aborts in-flight transports through their registered callbacks
    state->cancel.cancel();
    std::lock_guard<std::mutex> lock(state->mutex);
    this->abortQueuedLocked(*state, "aborted: Upload aborted");
}

BatchHandle UploadCoordinator::resume(const std::string &batch_id) {
    auto previous = this->find(batch_id);
    BatchSnapshot snapshot;
    if (previous) {
        std::lock_guard<std::mutex> lock(previous->mutex);
        if (previous->running) {
            throw std::runtime_error("batch_running: Batch is still running (id: " + batch_id + ")");
        }
        snapshot.batch_id = batch_id;
        snapshot.destination = previous->destination;
        snapshot.files = previous->batch.files;
    } else {
        auto loaded = this->snapshots != nullptr ? this->snapshots->load(batch_id) : std::nullopt;
        if (!loaded) {
            throw ValidationError("unknown_batch: No resumable snapshot (id: " + batch_id + ")");
        }
        snapshot = std::move(*loaded);
    }

    auto state = std::make_shared<BatchState>();
    state->destination = snapshot.destination;
    state->batch.batch_id = snapshot.batch_id;
    state->batch.total_files = snapshot.files.size();
    state->batch.network_status = this->monitor.status();
    state->batch.files = std::move(snapshot.files);
    std::size_t resumed = 0;
    for (auto &task : state->batch.files) {
        if (task.status == UploadStatus::Completed) {
            state->batch.completed_files++;
            continue;
        }
        reset_for_resume(task);
        resumed++;
    }
    log_info("[batch ", batch_id, "] resuming ", resumed, " file(s), ", state->batch.completed_files, " already completed");

    this->authorizePending(*state);
    {
        std::lock_guard<std::mutex> lock(this->states_mutex);
        this->states[batch_id] = state;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    this->saveSnapshotLocked(*state);
    this->channel.publish(to_progress(state->batch));
    return BatchHandle{batch_id};
}

void UploadCoordinator::close(const std::string &batch_id) {
    auto state = this->find(batch_id);
    if (state) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->running) {
            throw std::runtime_error("batch_running: Cannot close a running batch (id: " + batch_id + ")");
        }
    }
    {
        std::lock_guard<std::mutex> lock(this->states_mutex);
        this->states.erase(batch_id);
    }
    if (this->snapshots != nullptr) {
        this->snapshots->remove(batch_id);
    }
}

std::shared_ptr<ProgressSubscription> UploadCoordinator::subscribe(std::size_t capacity) {
    return this->channel.subscribe(capacity);
}

std::optional<UploadBatch> UploadCoordinator::batch(const std::string &batch_id) const {
    auto state = this->find(batch_id);
    if (!state) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->batch;
}

std::vector<std::string> UploadCoordinator::recoverable() const {
    std::vector<std::string> ids;
    if (this->snapshots == nullptr) {
        return ids;
    }
    for (const auto &snapshot : this->snapshots->loadAll()) {
        bool all_completed = std::all_of(snapshot.files.begin(), snapshot.files.end(), [](const FileUploadTask &task) {
            return task.status == UploadStatus::Completed;
        });
        if (all_completed) {
            continue;
        }
        auto state = this->find(snapshot.batch_id);
        if (state) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->running) {
                continue;
            }
        }
        ids.push_back(snapshot.batch_id);
    }
    return ids;
}

} // namespace uplink
