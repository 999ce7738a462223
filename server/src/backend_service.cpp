#include "backend_service.hpp"

#include "uplink/errors.hpp"
#include "uplink/helpers.hpp"
#include "uplink/log.hpp"

#include <algorithm>

namespace {

std::string require_string(const nlohmann::json &request, const char *key) {
    if (!request.contains(key) || !request[key].is_string() || request[key].get<std::string>().empty()) {
        throw uplink::NonRetryableClientError(std::string("bad_request: Missing '") + key + "'");
    }
    return request[key].get<std::string>();
}

bool valid_object_key(const std::string &key) {
    if (key.empty() || key.front() == '/') {
        return false;
    }
    for (const auto &part : uplink::split(key, '/')) {
        if (part.empty() || part == "." || part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace

BackendService::BackendService(const ServerOptions &options)
    : server_options(options), record_store(options.root) {
    std::filesystem::create_directories(std::filesystem::path(options.root) / "objects");
}

nlohmann::json error_response(const std::exception &e) {
    int status = 500;
    if (auto upload_error = dynamic_cast<const uplink::UploadError *>(&e)) {
        status = upload_error->status() > 0 ? upload_error->status() : 400;
    } else if (dynamic_cast<const nlohmann::json::exception *>(&e)) {
        status = 400;
    }
    return nlohmann::json{{"status", status}, {"error", e.what()}};
}

nlohmann::json BackendService::dispatch(const nlohmann::json &request) {
    try {
        std::string op = require_string(request, "op");
        if (op == "create_records") {
            return this->createRecords(request);
        } else if (op == "authorize_uploads") {
            return this->authorizeUploads(request);
        } else if (op == "finalize_record") {
            return this->finalizeRecord(request);
        }
        throw uplink::NonRetryableClientError("unknown_op: Unknown operation: " + op);
    } catch (const std::exception &e) {
        uplink::log_warning("[backend] request failed: ", e.what());
        return error_response(e);
    }
}

nlohmann::json BackendService::createRecords(const nlohmann::json &request) {
    std::string batch_id = require_string(request, "batchId");
    if (!request.contains("files")) {
        throw uplink::NonRetryableClientError("bad_request: Missing 'files'");
    }
    auto ids = this->record_store.create(batch_id, request["files"]);
    return nlohmann::json{{"status", 200}, {"ids", ids}};
}

nlohmann::json BackendService::authorizeUploads(const nlohmann::json &request) {
    if (!request.contains("ids") || !request["ids"].is_array()) {
        throw uplink::NonRetryableClientError("bad_request: 'ids' must be an array");
    }
    int hours = request.value("expirationHours", 24);
    if (hours < 1) {
        throw uplink::NonRetryableClientError("bad_request: 'expirationHours' must be >= 1");
    }
    auto ttl = std::min(this->server_options.token_ttl, std::chrono::seconds(std::chrono::hours(hours)));
    uplink::HostPort endpoint{this->server_options.public_host, this->server_options.port};

    this->token_registry.purgeExpired();
    nlohmann::json items = nlohmann::json::array();
    nlohmann::json errors = nlohmann::json::object();
    for (const auto &value : request["ids"]) {
        if (!value.is_string()) {
            throw uplink::NonRetryableClientError("bad_request: Record ids must be strings");
        }
        std::string id = value.get<std::string>();
        if (!this->record_store.exists(id)) {
            errors[id] = "not_found: Record does not exist";
            continue;
        }
        const auto &record = this->record_store.get(id);
        if (record.value("status", std::string()) == "ready") {
            errors[id] = "already_finalized: Record already has an object";
            continue;
        }
        std::string key = record["objectKey"].get<std::string>();
        items.push_back({
            {"id", id},
            {"objectKey", key},
            {"uploadUrl", uplink::make_upload_url(endpoint, key)},
            {"authToken", this->token_registry.issue(key, ttl)},
            {"contentType", record.value("contentType", std::string("application/octet-stream"))},
            {"expiresInSeconds", ttl.count()},
        });
    }
    uplink::log_info("[backend] authorized ", items.size(), " upload(s), refused ", errors.size());
    return nlohmann::json{{"status", 200}, {"success", errors.empty()}, {"items", items}, {"errors", errors}};
}

nlohmann::json BackendService::finalizeRecord(const nlohmann::json &request) {
    std::string id = require_string(request, "recordId");
    auto size = request.value("fileSizeBytes", static_cast<std::uint64_t>(0));
    double duration = request.value("durationSeconds", 0.0);
    nlohmann::json response = this->record_store.finalize(id, size, duration);
    response["status"] = 200;
    return response;
}

AdmittedPut BackendService::admitPut(const nlohmann::json &header) {
    AdmittedPut put;
    put.object_key = require_string(header, "objectKey");
    if (!valid_object_key(put.object_key)) {
        throw uplink::NonRetryableClientError("bad_request: Invalid object key " + put.object_key);
    }
    TokenCheck check = this->token_registry.check(header.value("authToken", std::string()), put.object_key);
    if (!check.ok()) {
        uplink::throw_for_status(check.status, check.error);
    }
    if (!header.contains("size") || !header["size"].is_number_integer() ||
        (!header["size"].is_number_unsigned() && header["size"].get<std::int64_t>() < 0)) {
        throw uplink::NonRetryableClientError("bad_request: Missing 'size'");
    }
    put.size = header["size"].get<std::uint64_t>();
    if (put.size > this->server_options.max_object_size) {
        throw uplink::NonRetryableClientError("payload_too_large: Object exceeds " +
                                              std::to_string(this->server_options.max_object_size) + " bytes", 413);
    }
    put.content_hash = header.value("contentHash", std::string());
    put.target = std::filesystem::path(this->server_options.root) / "objects" / put.object_key;
    return put;
}
