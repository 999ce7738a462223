#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// media records kept in <root>/records.json, one entry per uploaded file
class RecordStore {
public:
    explicit RecordStore(const std::string &root);

    // creates one pending record per entry of `files`, ids in input order
    std::vector<std::string> create(const std::string &batch_id, const nlohmann::json &files);

    bool exists(const std::string &id) const;
    // throws not_found (404) for unknown ids
    const nlohmann::json &get(const std::string &id) const;

    // first call fixes size and duration; later calls return the stored values
    nlohmann::json finalize(const std::string &id, std::uint64_t file_size_bytes, double duration_seconds);

    std::size_t size() const { return this->records.size(); }

private:
    void save() const;

    std::string path;
    nlohmann::json records;
};

// <batchId>/<recordId>-<file name with unsafe characters replaced>
std::string make_object_key(const std::string &batch_id, const std::string &record_id, const std::string &file_name);
