#include "uplink/snapshot_store.hpp"
#include "uplink/log.hpp"

#include <fstream>
#include <stdexcept>

namespace uplink {

namespace {

bool valid_batch_id(const std::string &batch_id) {
    if (batch_id.empty()) {
        return false;
    }
    for (char c : batch_id) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace

bool BatchSnapshot::settled() const {
    for (const auto &task : this->files) {
        if (!is_terminal(task.status)) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json &j, const FileUploadTask &task) {
    j = nlohmann::json{
        {"fileName", task.file_name},
        {"localPath", task.local_path.string()},
        {"contentType", task.content_type},
        {"durationSeconds", task.duration_seconds},
        {"metadata", task.metadata},
        {"recordId", task.record_id},
        {"fileSizeBytes", task.file_size_bytes},
        {"uploadedBytes", task.uploaded_bytes},
        {"status", to_string(task.status)},
        {"error", task.error},
        {"retryCount", task.retry_count},
        {"objectKey", task.remote_object_key},
    };
}

void from_json(const nlohmann::json &j, FileUploadTask &task) {
    j.at("fileName").get_to(task.file_name);
    task.local_path = j.at("localPath").get<std::string>();
    task.content_type = j.value("contentType", std::string("application/octet-stream"));
    task.duration_seconds = j.value("durationSeconds", 0.0);
    task.metadata = j.value("metadata", std::map<std::string, std::string>{});
    task.record_id = j.value("recordId", std::string());
    task.file_size_bytes = j.value("fileSizeBytes", static_cast<std::uint64_t>(0));
    task.uploaded_bytes = j.value("uploadedBytes", static_cast<std::uint64_t>(0));
    task.status = parse_upload_status(j.value("status", std::string("pending")));
    task.error = j.value("error", std::string());
    task.retry_count = j.value("retryCount", 0);
    task.remote_object_key = j.value("objectKey", std::string());
}

void to_json(nlohmann::json &j, const BatchSnapshot &snapshot) {
    j = nlohmann::json{
        {"batchId", snapshot.batch_id},
        {"timestamp", snapshot.timestamp_ms},
        {"destination", {{"fields", snapshot.destination.fields}, {"requiredFields", snapshot.destination.required_fields}}},
        {"files", snapshot.files},
    };
}

void from_json(const nlohmann::json &j, BatchSnapshot &snapshot) {
    j.at("batchId").get_to(snapshot.batch_id);
    j.at("timestamp").get_to(snapshot.timestamp_ms);
    if (j.contains("destination")) {
        const auto &destination = j.at("destination");
        snapshot.destination.fields = destination.value("fields", std::map<std::string, std::string>{});
        snapshot.destination.required_fields = destination.value("requiredFields", std::vector<std::string>{});
    }
    j.at("files").get_to(snapshot.files);
}

FileSnapshotStore::FileSnapshotStore(std::filesystem::path dir, std::chrono::hours freshness)
    : dir(std::move(dir)), freshness(freshness) {
    std::filesystem::create_directories(this->dir);
}

std::filesystem::path FileSnapshotStore::pathFor(const std::string &batch_id) const {
    if (!valid_batch_id(batch_id)) {
        throw std::invalid_argument("invalid_batch_id: Batch id contains unsupported characters: " + batch_id);
    }
    return this->dir / (batch_id + ".json");
}

bool FileSnapshotStore::fresh(const BatchSnapshot &snapshot) const {
    std::int64_t window_ms = std::chrono::duration_cast<std::chrono::milliseconds>(this->freshness).count();
    return now_ms() - snapshot.timestamp_ms < window_ms;
}

std::optional<BatchSnapshot> FileSnapshotStore::read(const std::filesystem::path &path) const {
    std::ifstream infile(path, std::ios::binary);
    if (!infile) {
        return std::nullopt;
    }
    try {
        nlohmann::json doc;
        infile >> doc;
        return doc.get<BatchSnapshot>();
    } catch (const std::exception &e) {
        log_warning("ignoring unreadable snapshot ", path.string(), ": ", e.what());
        return std::nullopt;
    }
}

void FileSnapshotStore::save(const BatchSnapshot &snapshot) {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::filesystem::path path = this->pathFor(snapshot.batch_id);
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream outfile(tmp, std::ios::binary | std::ios::trunc);
        if (!outfile) {
            throw std::runtime_error("file_open_failed: Failed to open snapshot file for writing (path: " + tmp.string() + ")");
        }
        outfile << nlohmann::json(snapshot).dump(2);
        if (!outfile) {
            throw std::runtime_error("file_write_failed: Failed to write snapshot (path: " + tmp.string() + ")");
        }
    }
    std::filesystem::rename(tmp, path);
}

std::optional<BatchSnapshot> FileSnapshotStore::load(const std::string &batch_id) {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto snapshot = this->read(this->pathFor(batch_id));
    if (!snapshot || !this->fresh(*snapshot)) {
        return std::nullopt;
    }
    return snapshot;
}

void FileSnapshotStore::remove(const std::string &batch_id) {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::error_code ec;
    std::filesystem::remove(this->pathFor(batch_id), ec);
}

std::vector<BatchSnapshot> FileSnapshotStore::loadAll() {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<BatchSnapshot> snapshots;
    for (const auto &entry : std::filesystem::directory_iterator(this->dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto snapshot = this->read(entry.path());
        if (snapshot && this->fresh(*snapshot)) {
            snapshots.push_back(std::move(*snapshot));
        }
    }
    return snapshots;
}

std::size_t FileSnapshotStore::purgeStale() {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<std::filesystem::path> stale;
    for (const auto &entry : std::filesystem::directory_iterator(this->dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto snapshot = this->read(entry.path());
        if (!snapshot || !this->fresh(*snapshot)) {
            stale.push_back(entry.path());
        }
    }
    for (const auto &path : stale) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            log_warning("failed to remove stale snapshot ", path.string(), ": ", ec.message());
        }
    }
    if (!stale.empty()) {
        log_info("discarded ", stale.size(), " stale upload snapshot(s)");
    }
    return stale.size();
}

} // namespace uplink
