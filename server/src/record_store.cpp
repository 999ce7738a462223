#include "record_store.hpp"

#include "uplink/errors.hpp"
#include "uplink/hasher.hpp"
#include "uplink/log.hpp"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>

RecordStore::RecordStore(const std::string &root) : path(root + "/records.json") {
    // if file does not exist, create empty database
    if (!std::filesystem::exists(this->path)) {
        this->records = nlohmann::json::object();
        this->save();
        return;
    }

    // load database
    std::ifstream file(this->path);
    if (!file.is_open()) {
        throw std::runtime_error("database: Could not open records database for reading");
    }
    try {
        file >> this->records;
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("database: Records database is corrupt: " + std::string(e.what()));
    }
    if (!this->records.is_object()) {
        throw std::runtime_error("database: Records database must be a JSON object");
    }
}

void RecordStore::save() const {
    std::string tmp = this->path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("database: Could not open records database for writing");
        }
        file << this->records.dump(4);
    }
    std::filesystem::rename(tmp, this->path);
}

std::vector<std::string> RecordStore::create(const std::string &batch_id, const nlohmann::json &files) {
    if (!files.is_array() || files.empty()) {
        throw uplink::NonRetryableClientError("bad_request: 'files' must be a non-empty array");
    }
    std::vector<std::string> ids;
    for (const auto &file : files) {
        if (!file.is_object() || !file.contains("fileName") || !file["fileName"].is_string()) {
            throw uplink::NonRetryableClientError("bad_request: Every file needs a fileName");
        }
        std::string id = uplink::random_hex(12);
        std::string file_name = file["fileName"].get<std::string>();
        this->records[id] = {
            {"batchId", batch_id},
            {"fileName", file_name},
            {"contentType", file.value("contentType", std::string("application/octet-stream"))},
            {"declaredSizeBytes", file.value("fileSizeBytes", static_cast<std::uint64_t>(0))},
            {"metadata", file.value("metadata", nlohmann::json::object())},
            {"objectKey", make_object_key(batch_id, id, file_name)},
            {"status", "pending"},
            {"createdAt", static_cast<std::int64_t>(std::time(nullptr))},
        };
        ids.push_back(id);
    }
    this->save();
    uplink::log_info("[records] created ", ids.size(), " pending record(s) for batch ", batch_id);
    return ids;
}

bool RecordStore::exists(const std::string &id) const {
    return this->records.contains(id);
}

const nlohmann::json &RecordStore::get(const std::string &id) const {
    auto it = this->records.find(id);
    if (it == this->records.end()) {
        throw uplink::NonRetryableClientError("not_found: Record does not exist (id: " + id + ")", 404);
    }
    return *it;
}

nlohmann::json RecordStore::finalize(const std::string &id, std::uint64_t file_size_bytes, double duration_seconds) {
    this->get(id);
    auto &record = this->records[id];
    bool already = record.value("status", std::string()) == "ready";
    if (!already) {
        record["status"] = "ready";
        record["fileSizeBytes"] = file_size_bytes;
        record["durationSeconds"] = duration_seconds;
        record["finalizedAt"] = static_cast<std::int64_t>(std::time(nullptr));
        this->save();
        uplink::log_info("[records] finalized ", id, " (", file_size_bytes, " bytes)");
    }
    return nlohmann::json{
        {"recordId", id},
        {"fileSizeBytes", record["fileSizeBytes"]},
        {"durationSeconds", record["durationSeconds"]},
        {"alreadyFinalized", already},
    };
}

std::string make_object_key(const std::string &batch_id, const std::string &record_id, const std::string &file_name) {
    std::string safe;
    for (unsigned char c : file_name) {
        safe += (std::isalnum(c) || c == '.' || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    }
    // no hidden files and no ".." segments
    while (!safe.empty() && safe.front() == '.') {
        safe.front() = '_';
    }
    if (safe.empty()) {
        safe = "file";
    }
    return batch_id + "/" + record_id + "-" + safe;
}
