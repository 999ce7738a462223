#pragma once

#include "uplink/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace uplink {

constexpr int SNAPSHOT_FRESHNESS_HOURS = 24;

// persisted batch state, written after every status transition
struct BatchSnapshot {
    std::string batch_id;
    std::int64_t timestamp_ms = 0;
    DestinationMetadata destination;
    std::vector<FileUploadTask> files;

    bool settled() const;
};

class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual void save(const BatchSnapshot &snapshot) = 0;
    virtual std::optional<BatchSnapshot> load(const std::string &batch_id) = 0;
    virtual void remove(const std::string &batch_id) = 0;
    // fresh snapshots only
    virtual std::vector<BatchSnapshot> loadAll() = 0;
    // deletes expired and unreadable entries, returns how many were dropped
    virtual std::size_t purgeStale() = 0;
};

// one <batchId>.json per batch under `dir`
class FileSnapshotStore : public SnapshotStore {
public:
    explicit FileSnapshotStore(std::filesystem::path dir, std::chrono::hours freshness = std::chrono::hours(SNAPSHOT_FRESHNESS_HOURS));

    void save(const BatchSnapshot &snapshot) override;
    std::optional<BatchSnapshot> load(const std::string &batch_id) override;
    void remove(const std::string &batch_id) override;
    std::vector<BatchSnapshot> loadAll() override;
    std::size_t purgeStale() override;

private:
    std::filesystem::path pathFor(const std::string &batch_id) const;
    bool fresh(const BatchSnapshot &snapshot) const;
    std::optional<BatchSnapshot> read(const std::filesystem::path &path) const;

    std::filesystem::path dir;
    std::chrono::hours freshness;
    mutable std::mutex mutex;
};

void to_json(nlohmann::json &j, const FileUploadTask &task);
void from_json(const nlohmann::json &j, FileUploadTask &task);
void to_json(nlohmann::json &j, const BatchSnapshot &snapshot);
void from_json(const nlohmann::json &j, BatchSnapshot &snapshot);

} // namespace uplink
