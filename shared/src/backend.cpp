#include "uplink/backend.hpp"
#include "uplink/errors.hpp"
#include "uplink/log.hpp"

#include <set>

namespace uplink {

SocketRpcChannel::SocketRpcChannel(HostPort endpoint, std::chrono::milliseconds timeout)
    : endpoint(std::move(endpoint)), timeout(timeout) {
}

nlohmann::json SocketRpcChannel::call(const std::string &op, const nlohmann::json &params) {
    Deadline deadline = Clock::now() + this->timeout;
    nlohmann::json request = params;
    request["op"] = op;

    ScopedFd sock(connect_to(this->endpoint, deadline));
    send_msg(sock.get(), request.dump(), deadline);
    std::string raw = recv_msg(sock.get(), deadline);

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error &e) {
        throw TransientNetworkError("bad_response: Backend sent malformed JSON for " + op + ": " + e.what());
    }
    check_response(response);
    return response;
}

void check_response(const nlohmann::json &response) {
    if (!response.is_object()) {
        throw TransientNetworkError("bad_response: Backend response is not an object");
    }
    int status = response.value("status", 200);
    if (status >= 400) {
        throw_for_status(status, response.value("error", "http_" + std::to_string(status) + ": Backend request failed"));
    }
}

std::vector<std::string> RpcRecordClient::createPending(const std::string &batch_id, const std::vector<FileUploadTask> &files) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto &task : files) {
        items.push_back({
            {"fileName", task.file_name},
            {"contentType", task.content_type},
            {"fileSizeBytes", task.file_size_bytes},
            {"durationSeconds", task.duration_seconds},
            {"metadata", task.metadata},
        });
    }
    nlohmann::json response = this->channel.call("create_records", {{"batchId", batch_id}, {"files", items}});

    if (!response.contains("ids") || !response["ids"].is_array()) {
        throw TransientNetworkError("bad_response: create_records response has no ids");
    }
    std::vector<std::string> ids = response["ids"].get<std::vector<std::string>>();
    if (ids.size() != files.size()) {
        throw TransientNetworkError("bad_response: create_records returned " + std::to_string(ids.size()) + " ids for " + std::to_string(files.size()) + " files");
    }
    return ids;
}

void to_json(nlohmann::json &j, const Authorization &auth) {
    j = nlohmann::json{
        {"id", auth.record_id},
        {"objectKey", auth.object_key},
        {"uploadUrl", auth.upload_url},
        {"authToken", auth.auth_token},
        {"contentType", auth.content_type},
        {"expiresInSeconds", auth.expires_in_seconds},
    };
}

void from_json(const nlohmann::json &j, Authorization &auth) {
    j.at("id").get_to(auth.record_id);
    j.at("objectKey").get_to(auth.object_key);
    j.at("uploadUrl").get_to(auth.upload_url);
    j.at("authToken").get_to(auth.auth_token);
    auth.content_type = j.value("contentType", std::string("application/octet-stream"));
    auth.expires_in_seconds = j.value("expiresInSeconds", static_cast<std::int64_t>(0));
}

nlohmann::json make_authorize_request(const std::string &batch_id, const std::vector<std::string> &record_ids, int expiration_hours) {
    return nlohmann::json{
        {"batchId", batch_id},
        {"ids", record_ids},
        {"expirationHours", expiration_hours},
    };
}

AuthorizationMap parse_authorize_response(const nlohmann::json &response, const std::vector<std::string> &record_ids) {
    AuthorizationMap result;
    std::set<std::string> wanted(record_ids.begin(), record_ids.end());

    if (!response.value("success", false) && !response.contains("items")) {
        std::string reason = response.value("error", std::string("authorization_failed: Backend refused authorization"));
        for (const auto &id : record_ids) {
            result[id].error = reason;
        }
        return result;
    }

    if (response.contains("items")) {
        for (const auto &item : response.at("items")) {
            Authorization auth;
            try {
                auth = item.get<Authorization>();
            } catch (const nlohmann::json::exception &e) {
                log_warning("skipping malformed authorization item: ", e.what());
                continue;
            }
            if (wanted.count(auth.record_id) == 0) {
                continue;
            }
            std::string id = auth.record_id;
            result[id].authorization = std::move(auth);
        }
    }
    if (response.contains("errors") && response["errors"].is_object()) {
        for (const auto &[id, reason] : response["errors"].items()) {
            if (wanted.count(id) == 0 || result[id].authorization) {
                continue;
            }
            result[id].error = reason.is_string() ? reason.get<std::string>() : reason.dump();
        }
    }
    for (const auto &id : record_ids) {
        auto &outcome = result[id];
        if (!outcome.authorization && outcome.error.empty()) {
            outcome.error = "missing_authorization: Backend returned no authorization for record " + id;
        }
    }
    return result;
}

AuthorizationMap RpcAuthorizationClient::authorize(const std::string &batch_id, const std::vector<std::string> &record_ids, int expiration_hours) {
    nlohmann::json response = this->channel.call("authorize_uploads", make_authorize_request(batch_id, record_ids, expiration_hours));
    return parse_authorize_response(response, record_ids);
}

FinalizeResult RpcFinalizeClient::finalize(const std::string &record_id, std::uint64_t file_size_bytes, double duration_seconds) {
    nlohmann::json response = this->channel.call("finalize_record", {
        {"recordId", record_id},
        {"fileSizeBytes", file_size_bytes},
        {"durationSeconds", duration_seconds},
    });
    FinalizeResult result;
    result.file_size_bytes = response.value("fileSizeBytes", file_size_bytes);
    result.duration_seconds = response.value("durationSeconds", duration_seconds);
    result.already_finalized = response.value("alreadyFinalized", false);
    return result;
}

} // namespace uplink
